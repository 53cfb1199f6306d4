#include "postgres_local_store.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace motium::offline {

using sync::EntityRecord;
using sync::EntityType;

PostgresLocalStore::PostgresLocalStore(std::shared_ptr<PostgresClient> db)
    : db_(std::move(db)) {}

bool PostgresLocalStore::ensure_schema() {
    auto result = db_->execute(R"(
        CREATE TABLE IF NOT EXISTS local_entities (
            entity_type TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            payload JSONB NOT NULL DEFAULT '{}'::jsonb,
            updated_at_ms BIGINT NOT NULL DEFAULT 0,
            deleted BOOLEAN NOT NULL DEFAULT FALSE,
            dirty BOOLEAN NOT NULL DEFAULT FALSE,
            PRIMARY KEY (entity_type, entity_id)
        );
        CREATE INDEX IF NOT EXISTS local_entities_dirty_idx
            ON local_entities (entity_type) WHERE dirty;
        CREATE TABLE IF NOT EXISTS sync_metadata (
            entity_type TEXT PRIMARY KEY,
            last_pull_watermark_ms BIGINT NOT NULL DEFAULT 0
        );
    )");
    if (!result.ok()) {
        LOG(ERROR) << "Failed to create local store schema: " << result.error();
        return false;
    }
    return true;
}

std::vector<EntityRecord> PostgresLocalStore::select_records(const std::string& where,
                                                             const std::string& entity_type) {
    std::vector<EntityRecord> records;

    auto result = db_->execute(
        "SELECT entity_type, entity_id, payload::text AS payload, updated_at_ms, deleted "
        "FROM local_entities WHERE " + where + " ORDER BY entity_id",
        {entity_type});
    if (!result.ok()) {
        return records;
    }

    for (const auto& row : result) {
        auto type = sync::entity_type_from_string(row.get_string("entity_type"));
        if (!type) {
            continue;
        }
        EntityRecord record;
        record.entity_type = *type;
        record.entity_id = row.get_string("entity_id");
        try {
            record.payload = nlohmann::json::parse(row.get_string("payload"));
        } catch (const nlohmann::json::parse_error& e) {
            LOG(WARNING) << "Unreadable payload for " << record.entity_id << ": " << e.what();
            continue;
        }
        record.updated_at_ms = row.get_int64("updated_at_ms");
        record.deleted = row.get_bool("deleted");
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<EntityRecord> PostgresLocalStore::get(EntityType entity_type,
                                                    const std::string& entity_id) {
    auto result = db_->execute(R"(
        SELECT payload::text AS payload, updated_at_ms, deleted
        FROM local_entities
        WHERE entity_type = $1 AND entity_id = $2
    )", {std::string(sync::entity_type_to_string(entity_type)), entity_id});
    if (!result.ok() || result.num_rows() == 0) {
        return std::nullopt;
    }

    auto row = result.row(0);
    EntityRecord record;
    record.entity_type = entity_type;
    record.entity_id = entity_id;
    try {
        record.payload = nlohmann::json::parse(row.get_string("payload"));
    } catch (const nlohmann::json::parse_error& e) {
        LOG(WARNING) << "Unreadable payload for " << entity_id << ": " << e.what();
        return std::nullopt;
    }
    record.updated_at_ms = row.get_int64("updated_at_ms");
    record.deleted = row.get_bool("deleted");
    return record;
}

std::vector<EntityRecord> PostgresLocalStore::list(EntityType entity_type) {
    return select_records("entity_type = $1", sync::entity_type_to_string(entity_type));
}

bool PostgresLocalStore::upsert(const EntityRecord& record, bool mark_dirty) {
    auto result = db_->execute(R"(
        INSERT INTO local_entities (entity_type, entity_id, payload, updated_at_ms, deleted, dirty)
        VALUES ($1, $2, $3::jsonb, $4, $5, $6)
        ON CONFLICT (entity_type, entity_id) DO UPDATE SET
            payload = EXCLUDED.payload,
            updated_at_ms = EXCLUDED.updated_at_ms,
            deleted = EXCLUDED.deleted,
            dirty = EXCLUDED.dirty
    )", {
        std::string(sync::entity_type_to_string(record.entity_type)),
        record.entity_id,
        record.payload.dump(),
        std::to_string(record.updated_at_ms),
        std::string(record.deleted ? "true" : "false"),
        std::string(mark_dirty ? "true" : "false")
    });
    return result.ok();
}

bool PostgresLocalStore::remove(EntityType entity_type, const std::string& entity_id) {
    auto result = db_->execute(
        "DELETE FROM local_entities WHERE entity_type = $1 AND entity_id = $2",
        {std::string(sync::entity_type_to_string(entity_type)), entity_id});
    return result.ok() && result.affected_rows() > 0;
}

std::vector<EntityRecord> PostgresLocalStore::list_dirty(EntityType entity_type) {
    return select_records("entity_type = $1 AND dirty",
                          sync::entity_type_to_string(entity_type));
}

bool PostgresLocalStore::is_dirty(EntityType entity_type, const std::string& entity_id) {
    auto value = db_->execute_scalar(
        "SELECT dirty FROM local_entities WHERE entity_type = $1 AND entity_id = $2",
        {std::string(sync::entity_type_to_string(entity_type)), entity_id});
    return value && *value == "t";
}

bool PostgresLocalStore::clear_dirty(EntityType entity_type, const std::string& entity_id,
                                     int64_t pushed_updated_at_ms) {
    auto result = db_->execute(R"(
        UPDATE local_entities SET dirty = FALSE
        WHERE entity_type = $1 AND entity_id = $2 AND dirty AND updated_at_ms <= $3
    )", {
        std::string(sync::entity_type_to_string(entity_type)),
        entity_id,
        std::to_string(pushed_updated_at_ms)
    });
    return result.ok() && result.affected_rows() > 0;
}

int64_t PostgresLocalStore::last_pull_watermark(EntityType entity_type) {
    auto value = db_->execute_scalar(
        "SELECT last_pull_watermark_ms FROM sync_metadata WHERE entity_type = $1",
        {std::string(sync::entity_type_to_string(entity_type))});
    return value ? std::stoll(*value) : 0;
}

bool PostgresLocalStore::set_last_pull_watermark(EntityType entity_type, int64_t watermark_ms) {
    auto result = db_->execute(R"(
        INSERT INTO sync_metadata (entity_type, last_pull_watermark_ms)
        VALUES ($1, $2)
        ON CONFLICT (entity_type) DO UPDATE SET
            last_pull_watermark_ms = EXCLUDED.last_pull_watermark_ms
    )", {
        std::string(sync::entity_type_to_string(entity_type)),
        std::to_string(watermark_ms)
    });
    return result.ok();
}

bool PostgresLocalStore::reset_pull_watermarks() {
    auto result = db_->execute("UPDATE sync_metadata SET last_pull_watermark_ms = 0");
    if (!result.ok()) {
        LOG(ERROR) << "Failed to reset pull watermarks: " << result.error();
        return false;
    }
    return true;
}

}  // namespace motium::offline
