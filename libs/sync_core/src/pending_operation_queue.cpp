#include "pending_operation_queue.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

#include <glog/logging.h>

namespace motium::sync {

bool InMemoryPendingOperationStore::insert(const PendingOperation& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : operations_) {
        if (existing.id == op.id) {
            return false;
        }
    }
    operations_.push_back(op);
    return true;
}

bool InMemoryPendingOperationStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(operations_.begin(), operations_.end(),
                           [&](const PendingOperation& op) { return op.id == id; });
    if (it == operations_.end()) {
        return false;
    }
    operations_.erase(it);
    return true;
}

std::vector<PendingOperation> InMemoryPendingOperationStore::list_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_;
}

bool InMemoryPendingOperationStore::record_failure(const std::string& id,
                                                   int64_t attempt_ms,
                                                   const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& op : operations_) {
        if (op.id == id) {
            op.retry_count++;
            op.last_attempt_ms = attempt_ms;
            op.last_error = error;
            return true;
        }
    }
    return false;
}

bool InMemoryPendingOperationStore::reset_retry(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& op : operations_) {
        if (op.id == id) {
            op.retry_count = 0;
            op.last_attempt_ms.reset();
            op.last_error.clear();
            return true;
        }
    }
    return false;
}

size_t InMemoryPendingOperationStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return operations_.size();
}

bool InMemoryPendingOperationStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    operations_.clear();
    return true;
}

PendingOperationQueue::PendingOperationQueue(
    std::shared_ptr<PendingOperationStore> store,
    std::shared_ptr<Clock> clock,
    RetryPolicy policy)
    : store_(std::move(store)), clock_(std::move(clock)), policy_(policy) {}

std::string PendingOperationQueue::generate_operation_id() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(16) << dist(gen);
    ss << std::setw(16) << dist(gen);
    return ss.str();
}

std::string PendingOperationQueue::enqueue(OperationType type,
                                           EntityType entity_type,
                                           const std::string& entity_id,
                                           std::optional<nlohmann::json> payload) {
    PendingOperation op;
    op.id = generate_operation_id();
    op.type = type;
    op.entity_type = entity_type;
    op.entity_id = entity_id;
    if (type != OperationType::DELETE) {
        op.payload = std::move(payload);
    }
    op.timestamp_ms = clock_->now_ms();
    op.retry_count = 0;

    if (!store_->insert(op)) {
        LOG(ERROR) << "Failed to persist " << operation_type_to_string(type)
                   << " for " << entity_type_to_string(entity_type)
                   << " " << entity_id;
        return "";
    }

    VLOG(1) << "Enqueued " << operation_type_to_string(type) << " "
            << entity_type_to_string(entity_type) << " " << entity_id
            << " as " << op.id;
    return op.id;
}

void PendingOperationQueue::dequeue(const std::string& id) {
    if (!store_->remove(id)) {
        VLOG(1) << "Dequeue of unknown operation " << id << " ignored";
    }
}

std::vector<PendingOperation> PendingOperationQueue::list_pending() const {
    return store_->list_all();
}

void PendingOperationQueue::mark_failed(const std::string& id, const std::string& error) {
    if (!store_->record_failure(id, clock_->now_ms(), error)) {
        LOG(WARNING) << "mark_failed on unknown operation " << id;
    }
}

size_t PendingOperationQueue::pending_count() const {
    return store_->count();
}

std::vector<PendingOperation> PendingOperationQueue::list_by_entity_type(
    EntityType entity_type) const {
    std::vector<PendingOperation> result;
    for (auto& op : store_->list_all()) {
        if (op.entity_type == entity_type) {
            result.push_back(std::move(op));
        }
    }
    return result;
}

bool PendingOperationQueue::has_pending_operation(const std::string& entity_id,
                                                  EntityType entity_type) const {
    for (const auto& op : store_->list_all()) {
        if (op.entity_type == entity_type && op.entity_id == entity_id) {
            return true;
        }
    }
    return false;
}

std::vector<PendingOperation> PendingOperationQueue::list_ready_for_retry() const {
    int64_t now = clock_->now_ms();
    std::vector<PendingOperation> result;
    for (auto& op : store_->list_all()) {
        if (!is_dead_lettered(op) && is_ready_for_retry(op, now)) {
            result.push_back(std::move(op));
        }
    }
    return result;
}

std::vector<PendingOperation> PendingOperationQueue::list_dead_lettered() const {
    std::vector<PendingOperation> result;
    for (auto& op : store_->list_all()) {
        if (is_dead_lettered(op)) {
            result.push_back(std::move(op));
        }
    }
    return result;
}

size_t PendingOperationQueue::dead_lettered_count() const {
    return list_dead_lettered().size();
}

bool PendingOperationQueue::reset_retry(const std::string& id) {
    if (!store_->reset_retry(id)) {
        LOG(WARNING) << "reset_retry on unknown operation " << id;
        return false;
    }
    LOG(INFO) << "Operation " << id << " requeued for retry";
    return true;
}

size_t PendingOperationQueue::reset_failed_operations() {
    size_t reset = 0;
    for (const auto& op : store_->list_all()) {
        if (op.retry_count > 0 && store_->reset_retry(op.id)) {
            reset++;
        }
    }
    LOG(INFO) << "Reset " << reset << " failed operations for retry";
    return reset;
}

void PendingOperationQueue::clear_all() {
    if (!store_->clear()) {
        LOG(ERROR) << "Failed to clear pending operations";
        return;
    }
    LOG(INFO) << "Pending operation queue cleared";
}

bool PendingOperationQueue::is_dead_lettered(const PendingOperation& op) const {
    return policy_.max_retry_count > 0 && op.retry_count >= policy_.max_retry_count;
}

bool PendingOperationQueue::is_ready_for_retry(const PendingOperation& op,
                                               int64_t now_ms) const {
    if (!op.last_attempt_ms) {
        return true;
    }
    return now_ms >= *op.last_attempt_ms + backoff_ms(op.retry_count);
}

int64_t PendingOperationQueue::backoff_ms(int retry_count) const {
    if (retry_count <= 0) {
        return std::min(policy_.base_backoff_ms, policy_.max_backoff_ms);
    }
    int64_t backoff = policy_.base_backoff_ms;
    for (int i = 0; i < retry_count; ++i) {
        backoff *= 2;
        if (backoff >= policy_.max_backoff_ms) {
            return policy_.max_backoff_ms;
        }
    }
    return backoff;
}

}  // namespace motium::sync
