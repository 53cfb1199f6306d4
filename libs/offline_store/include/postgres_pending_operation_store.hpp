#pragma once

#include <memory>
#include <string>
#include <vector>

#include "pending_operation_queue.hpp"
#include "postgres_client.hpp"

namespace motium::offline {

/// Pending queue persisted in the pending_operations table. Insertion
/// order is kept by a BIGSERIAL sequence column.
class PostgresPendingOperationStore : public sync::PendingOperationStore {
public:
    explicit PostgresPendingOperationStore(std::shared_ptr<PostgresClient> db);

    /// Create the table and index if missing
    bool ensure_schema();

    bool insert(const sync::PendingOperation& op) override;
    bool remove(const std::string& id) override;
    std::vector<sync::PendingOperation> list_all() override;
    bool record_failure(const std::string& id, int64_t attempt_ms,
                        const std::string& error) override;
    bool reset_retry(const std::string& id) override;
    size_t count() override;
    bool clear() override;

private:
    std::shared_ptr<PostgresClient> db_;
};

}  // namespace motium::offline
