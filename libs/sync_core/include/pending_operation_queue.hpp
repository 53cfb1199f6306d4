#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "sync_types.hpp"

namespace motium::sync {

/// Durable backing for the pending queue. Implementations keep operations
/// in insertion order and must be safe to call from several threads.
class PendingOperationStore {
public:
    virtual ~PendingOperationStore() = default;

    virtual bool insert(const PendingOperation& op) = 0;

    /// Returns false if the id is not stored
    virtual bool remove(const std::string& id) = 0;

    /// All stored operations, oldest first
    virtual std::vector<PendingOperation> list_all() = 0;

    /// Increment retry_count, set last_attempt_ms and last_error.
    /// Returns false if the id is not stored.
    virtual bool record_failure(const std::string& id, int64_t attempt_ms,
                                const std::string& error) = 0;

    /// Zero retry_count and clear last_attempt_ms / last_error
    virtual bool reset_retry(const std::string& id) = 0;

    virtual size_t count() = 0;
    virtual bool clear() = 0;
};

class InMemoryPendingOperationStore : public PendingOperationStore {
public:
    bool insert(const PendingOperation& op) override;
    bool remove(const std::string& id) override;
    std::vector<PendingOperation> list_all() override;
    bool record_failure(const std::string& id, int64_t attempt_ms,
                        const std::string& error) override;
    bool reset_retry(const std::string& id) override;
    size_t count() override;
    bool clear() override;

private:
    std::mutex mutex_;
    std::vector<PendingOperation> operations_;
};

/// Retry ceiling and backoff between automatic attempts
struct RetryPolicy {
    int max_retry_count = 5;
    int64_t base_backoff_ms = 2000;
    int64_t max_backoff_ms = 300000;
};

/// Ordered record of local mutations awaiting remote confirmation.
///
/// An operation leaves the queue only through dequeue(). Operations whose
/// retry_count reached the policy ceiling are dead-lettered: they stay
/// stored and visible through list_dead_lettered(), but automatic sync
/// passes no longer attempt them until reset_retry() is called.
class PendingOperationQueue {
public:
    PendingOperationQueue(std::shared_ptr<PendingOperationStore> store,
                          std::shared_ptr<Clock> clock,
                          RetryPolicy policy = RetryPolicy{});

    /// Record a mutation. Returns the new operation id, or an empty string
    /// if the backing store rejected the write.
    std::string enqueue(OperationType type,
                        EntityType entity_type,
                        const std::string& entity_id,
                        std::optional<nlohmann::json> payload = std::nullopt);

    /// Remove an operation. Absent ids are ignored.
    void dequeue(const std::string& id);

    /// Every queued operation in enqueue order, dead-lettered ones included
    std::vector<PendingOperation> list_pending() const;

    /// Count a failed remote-apply attempt against the operation
    void mark_failed(const std::string& id, const std::string& error = "");

    size_t pending_count() const;

    std::vector<PendingOperation> list_by_entity_type(EntityType entity_type) const;
    bool has_pending_operation(const std::string& entity_id, EntityType entity_type) const;

    /// Operations that are not dead-lettered and whose backoff has elapsed
    std::vector<PendingOperation> list_ready_for_retry() const;

    std::vector<PendingOperation> list_dead_lettered() const;
    size_t dead_lettered_count() const;

    /// Operator requeue of a failed operation
    bool reset_retry(const std::string& id);

    /// reset_retry() on every operation with at least one failed attempt.
    /// Returns how many were reset.
    size_t reset_failed_operations();

    void clear_all();

    bool is_dead_lettered(const PendingOperation& op) const;
    bool is_ready_for_retry(const PendingOperation& op, int64_t now_ms) const;

    /// min(2^retry_count * base, max)
    int64_t backoff_ms(int retry_count) const;

    const RetryPolicy& retry_policy() const { return policy_; }

    static std::string generate_operation_id();

private:
    std::shared_ptr<PendingOperationStore> store_;
    std::shared_ptr<Clock> clock_;
    RetryPolicy policy_;
};

}  // namespace motium::sync
