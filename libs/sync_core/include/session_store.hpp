#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "clock.hpp"
#include "sync_types.hpp"

namespace motium::sync {

/// Secure session storage. Subclasses provide persistence; the expiry
/// queries are derived here and always evaluated against the clock at
/// call time.
class SessionStore {
public:
    explicit SessionStore(std::shared_ptr<Clock> clock);
    virtual ~SessionStore() = default;

    virtual std::optional<Session> load() = 0;
    virtual bool save(const Session& session) = 0;
    virtual bool clear() = 0;

    /// Replace token and expiry, keeping the rest of the stored session
    bool save_session(const std::string& access_token, int64_t expires_at_ms);

    /// True when an access token is stored
    bool has_session();

    /// now >= expires_at. A missing session counts as expired.
    bool is_token_expired();

    /// expires_at - now < minutes. Strict, so exactly `minutes` left is not soon.
    bool is_token_expiring_soon(int minutes);

    bool has_valid_session();

    std::optional<std::string> get_access_token();
    std::optional<std::string> get_refresh_token();
    std::optional<int64_t> get_expires_at();

protected:
    std::shared_ptr<Clock> clock_;
};

class InMemorySessionStore : public SessionStore {
public:
    explicit InMemorySessionStore(std::shared_ptr<Clock> clock);

    std::optional<Session> load() override;
    bool save(const Session& session) override;
    bool clear() override;

private:
    std::mutex mutex_;
    std::optional<Session> session_;
};

}  // namespace motium::sync
