#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "local_store.hpp"
#include "postgres_client.hpp"

namespace motium::offline {

/// Entities in local_entities, pull watermarks in sync_metadata
class PostgresLocalStore : public sync::LocalStore {
public:
    explicit PostgresLocalStore(std::shared_ptr<PostgresClient> db);

    bool ensure_schema();

    std::optional<sync::EntityRecord> get(sync::EntityType entity_type,
                                          const std::string& entity_id) override;
    std::vector<sync::EntityRecord> list(sync::EntityType entity_type) override;
    bool upsert(const sync::EntityRecord& record, bool mark_dirty) override;
    bool remove(sync::EntityType entity_type, const std::string& entity_id) override;
    std::vector<sync::EntityRecord> list_dirty(sync::EntityType entity_type) override;
    bool is_dirty(sync::EntityType entity_type, const std::string& entity_id) override;
    bool clear_dirty(sync::EntityType entity_type, const std::string& entity_id,
                     int64_t pushed_updated_at_ms) override;
    int64_t last_pull_watermark(sync::EntityType entity_type) override;
    bool set_last_pull_watermark(sync::EntityType entity_type, int64_t watermark_ms) override;
    bool reset_pull_watermarks() override;

private:
    std::vector<sync::EntityRecord> select_records(const std::string& where,
                                                   const std::string& entity_type);

    std::shared_ptr<PostgresClient> db_;
};

}  // namespace motium::offline
