#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace motium::sync {

/// Kind of local mutation recorded in the pending queue
enum class OperationType {
    CREATE = 0,
    UPDATE = 1,
    DELETE = 2
};

/// Synchronizable entity kinds
enum class EntityType {
    TRIP = 0,
    VEHICLE = 1,
    EXPENSE = 2,
    USER_PROFILE = 3
};

const char* operation_type_to_string(OperationType type);
std::optional<OperationType> operation_type_from_string(const std::string& name);

const char* entity_type_to_string(EntityType type);
std::optional<EntityType> entity_type_from_string(const std::string& name);

/// Every entity type, in the order a sync pass walks them
const std::vector<EntityType>& all_entity_types();

/// A local mutation awaiting remote confirmation
struct PendingOperation {
    std::string id;
    OperationType type = OperationType::CREATE;
    EntityType entity_type = EntityType::TRIP;
    std::string entity_id;
    std::optional<nlohmann::json> payload;  // absent for DELETE
    int64_t timestamp_ms = 0;
    int retry_count = 0;
    std::optional<int64_t> last_attempt_ms;
    std::string last_error;
};

nlohmann::json pending_operation_to_json(const PendingOperation& op);

/// Entity snapshot as held by the local store and exchanged with the backend
struct EntityRecord {
    EntityType entity_type = EntityType::TRIP;
    std::string entity_id;
    nlohmann::json payload = nlohmann::json::object();
    int64_t updated_at_ms = 0;
    bool deleted = false;  // tombstone
};

/// Authenticated session held by the secure session store
struct Session {
    std::string access_token;
    std::string refresh_token;
    int64_t expires_at_ms = 0;
    std::string user_id;
    std::string user_email;
    std::string token_type = "Bearer";
    int64_t created_at_ms = 0;
};

}  // namespace motium::sync
