#pragma once

#include "sync_types.hpp"

namespace motium::sync {

/// Remote credential refresh. Failures are thrown as RemoteError.
class AuthEndpoint {
public:
    virtual ~AuthEndpoint() = default;

    /// Exchange the refresh token of `current` for a new session
    virtual Session refresh_session(const Session& current) = 0;
};

}  // namespace motium::sync
