#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sync_types.hpp"

namespace motium::sync {

/// Local persistent entity store with a per-entity dirty marker and
/// per-entity-type pull watermarks. upsert is atomic by entity id.
class LocalStore {
public:
    virtual ~LocalStore() = default;

    virtual std::optional<EntityRecord> get(EntityType entity_type,
                                            const std::string& entity_id) = 0;

    virtual std::vector<EntityRecord> list(EntityType entity_type) = 0;

    virtual bool upsert(const EntityRecord& record, bool mark_dirty) = 0;

    virtual bool remove(EntityType entity_type, const std::string& entity_id) = 0;

    virtual std::vector<EntityRecord> list_dirty(EntityType entity_type) = 0;

    virtual bool is_dirty(EntityType entity_type, const std::string& entity_id) = 0;

    /// Clear the dirty marker unless the entity changed after the pushed
    /// snapshot (updated_at_ms > pushed_updated_at_ms). Returns true if cleared.
    virtual bool clear_dirty(EntityType entity_type, const std::string& entity_id,
                             int64_t pushed_updated_at_ms) = 0;

    /// 0 when this entity type was never pulled
    virtual int64_t last_pull_watermark(EntityType entity_type) = 0;
    virtual bool set_last_pull_watermark(EntityType entity_type, int64_t watermark_ms) = 0;

    /// Forget every watermark so the next pull fetches everything
    virtual bool reset_pull_watermarks() = 0;
};

class InMemoryLocalStore : public LocalStore {
public:
    std::optional<EntityRecord> get(EntityType entity_type,
                                    const std::string& entity_id) override;
    std::vector<EntityRecord> list(EntityType entity_type) override;
    bool upsert(const EntityRecord& record, bool mark_dirty) override;
    bool remove(EntityType entity_type, const std::string& entity_id) override;
    std::vector<EntityRecord> list_dirty(EntityType entity_type) override;
    bool is_dirty(EntityType entity_type, const std::string& entity_id) override;
    bool clear_dirty(EntityType entity_type, const std::string& entity_id,
                     int64_t pushed_updated_at_ms) override;
    int64_t last_pull_watermark(EntityType entity_type) override;
    bool set_last_pull_watermark(EntityType entity_type, int64_t watermark_ms) override;
    bool reset_pull_watermarks() override;

private:
    struct Entry {
        EntityRecord record;
        bool dirty = false;
    };
    using Key = std::pair<EntityType, std::string>;

    std::mutex mutex_;
    std::map<Key, Entry> entities_;
    std::map<EntityType, int64_t> watermarks_;
};

}  // namespace motium::sync
