#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sync_types.hpp"

namespace motium::sync {

struct PullResult {
    std::vector<EntityRecord> records;
    int64_t server_time_ms = 0;  // watermark for the next delta pull
};

/// Backend data endpoints. Pushes are upserts keyed by entity id, so a
/// retried push replaces rather than duplicates. Failures are thrown as
/// RemoteError.
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    virtual void push_entity(const EntityRecord& record) = 0;

    /// Deleting an entity the backend does not know is not an error
    virtual void delete_entity(EntityType entity_type, const std::string& entity_id) = 0;

    /// Records changed since `since_ms` (0 pulls everything), tombstones included
    virtual PullResult pull_entities(EntityType entity_type, int64_t since_ms) = 0;
};

}  // namespace motium::sync
