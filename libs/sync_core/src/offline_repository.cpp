#include "offline_repository.hpp"

#include <glog/logging.h>

namespace motium::sync {

OfflineRepository::OfflineRepository(std::shared_ptr<LocalStore> local_store,
                                     std::shared_ptr<PendingOperationQueue> queue,
                                     std::shared_ptr<Clock> clock)
    : local_store_(std::move(local_store)),
      queue_(std::move(queue)),
      clock_(std::move(clock)) {}

std::string OfflineRepository::save(EntityRecord record) {
    bool exists = local_store_->get(record.entity_type, record.entity_id).has_value();
    record.updated_at_ms = clock_->now_ms();
    record.deleted = false;

    if (!local_store_->upsert(record, /*mark_dirty=*/true)) {
        LOG(ERROR) << "Local save failed for " << entity_type_to_string(record.entity_type)
                   << " " << record.entity_id;
        return "";
    }

    OperationType type = exists ? OperationType::UPDATE : OperationType::CREATE;
    return queue_->enqueue(type, record.entity_type, record.entity_id, record.payload);
}

std::string OfflineRepository::remove(EntityType entity_type, const std::string& entity_id) {
    if (!local_store_->remove(entity_type, entity_id)) {
        VLOG(1) << "Removing " << entity_type_to_string(entity_type) << " " << entity_id
                << " which is not stored locally";
    }
    return queue_->enqueue(OperationType::DELETE, entity_type, entity_id);
}

}  // namespace motium::sync
