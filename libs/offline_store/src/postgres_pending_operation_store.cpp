#include "postgres_pending_operation_store.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace motium::offline {

using sync::PendingOperation;

PostgresPendingOperationStore::PostgresPendingOperationStore(std::shared_ptr<PostgresClient> db)
    : db_(std::move(db)) {}

bool PostgresPendingOperationStore::ensure_schema() {
    auto result = db_->execute(R"(
        CREATE TABLE IF NOT EXISTS pending_operations (
            seq BIGSERIAL,
            id TEXT PRIMARY KEY,
            operation_type TEXT NOT NULL,
            entity_type TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            payload JSONB,
            timestamp_ms BIGINT NOT NULL,
            retry_count INTEGER NOT NULL DEFAULT 0 CHECK (retry_count >= 0),
            last_attempt_ms BIGINT,
            last_error TEXT NOT NULL DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS pending_operations_entity_idx
            ON pending_operations (entity_type, entity_id);
    )");
    if (!result.ok()) {
        LOG(ERROR) << "Failed to create pending_operations: " << result.error();
        return false;
    }
    return true;
}

bool PostgresPendingOperationStore::insert(const PendingOperation& op) {
    std::optional<std::string> payload;
    if (op.payload) {
        payload = op.payload->dump();
    }
    std::optional<std::string> last_attempt;
    if (op.last_attempt_ms) {
        last_attempt = std::to_string(*op.last_attempt_ms);
    }

    auto result = db_->execute(R"(
        INSERT INTO pending_operations (
            id, operation_type, entity_type, entity_id, payload,
            timestamp_ms, retry_count, last_attempt_ms, last_error
        )
        VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7, $8, $9)
    )", {
        op.id,
        std::string(sync::operation_type_to_string(op.type)),
        std::string(sync::entity_type_to_string(op.entity_type)),
        op.entity_id,
        payload,
        std::to_string(op.timestamp_ms),
        std::to_string(op.retry_count),
        last_attempt,
        op.last_error
    });
    return result.ok();
}

bool PostgresPendingOperationStore::remove(const std::string& id) {
    auto result = db_->execute("DELETE FROM pending_operations WHERE id = $1", {id});
    return result.ok() && result.affected_rows() > 0;
}

std::vector<PendingOperation> PostgresPendingOperationStore::list_all() {
    std::vector<PendingOperation> operations;

    auto result = db_->execute(R"(
        SELECT id, operation_type, entity_type, entity_id, payload::text AS payload,
               timestamp_ms, retry_count, last_attempt_ms, last_error
        FROM pending_operations
        ORDER BY seq
    )");
    if (!result.ok()) {
        return operations;
    }

    for (const auto& row : result) {
        auto type = sync::operation_type_from_string(row.get_string("operation_type"));
        auto entity_type = sync::entity_type_from_string(row.get_string("entity_type"));
        if (!type || !entity_type) {
            LOG(WARNING) << "Skipping unreadable pending operation " << row.get_string("id");
            continue;
        }

        PendingOperation op;
        op.id = row.get_string("id");
        op.type = *type;
        op.entity_type = *entity_type;
        op.entity_id = row.get_string("entity_id");
        if (!row.is_null("payload")) {
            try {
                op.payload = nlohmann::json::parse(row.get_string("payload"));
            } catch (const nlohmann::json::parse_error& e) {
                LOG(WARNING) << "Pending operation " << op.id << " has unreadable payload: "
                             << e.what();
            }
        }
        op.timestamp_ms = row.get_int64("timestamp_ms");
        op.retry_count = static_cast<int>(row.get_int64("retry_count"));
        op.last_attempt_ms = row.get_optional_int64("last_attempt_ms");
        op.last_error = row.get_string("last_error");
        operations.push_back(std::move(op));
    }
    return operations;
}

bool PostgresPendingOperationStore::record_failure(const std::string& id,
                                                   int64_t attempt_ms,
                                                   const std::string& error) {
    auto result = db_->execute(R"(
        UPDATE pending_operations
        SET retry_count = retry_count + 1,
            last_attempt_ms = $2,
            last_error = $3
        WHERE id = $1
    )", {id, std::to_string(attempt_ms), error});
    return result.ok() && result.affected_rows() > 0;
}

bool PostgresPendingOperationStore::reset_retry(const std::string& id) {
    auto result = db_->execute(R"(
        UPDATE pending_operations
        SET retry_count = 0, last_attempt_ms = NULL, last_error = ''
        WHERE id = $1
    )", {id});
    return result.ok() && result.affected_rows() > 0;
}

size_t PostgresPendingOperationStore::count() {
    auto value = db_->execute_scalar("SELECT COUNT(*) FROM pending_operations");
    return value ? static_cast<size_t>(std::stoull(*value)) : 0;
}

bool PostgresPendingOperationStore::clear() {
    return db_->execute("DELETE FROM pending_operations").ok();
}

}  // namespace motium::offline
