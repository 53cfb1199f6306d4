#pragma once

#include <memory>
#include <string>

#include "clock.hpp"
#include "local_store.hpp"
#include "pending_operation_queue.hpp"

namespace motium::sync {

/// Write path used by the application for synchronizable entities.
/// Every local mutation is applied to the local store and recorded in the
/// pending queue in the same call, so nothing made offline is lost.
class OfflineRepository {
public:
    OfflineRepository(std::shared_ptr<LocalStore> local_store,
                      std::shared_ptr<PendingOperationQueue> queue,
                      std::shared_ptr<Clock> clock);

    /// Create or update. updated_at_ms is stamped with the current time.
    /// Returns the pending operation id, empty on failure.
    std::string save(EntityRecord record);

    /// Delete locally and queue the remote delete
    std::string remove(EntityType entity_type, const std::string& entity_id);

private:
    std::shared_ptr<LocalStore> local_store_;
    std::shared_ptr<PendingOperationQueue> queue_;
    std::shared_ptr<Clock> clock_;
};

}  // namespace motium::sync
