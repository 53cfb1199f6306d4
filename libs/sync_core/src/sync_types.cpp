#include "sync_types.hpp"

namespace motium::sync {

const char* operation_type_to_string(OperationType type) {
    switch (type) {
        case OperationType::CREATE: return "CREATE";
        case OperationType::UPDATE: return "UPDATE";
        case OperationType::DELETE: return "DELETE";
        default: return "UNKNOWN";
    }
}

std::optional<OperationType> operation_type_from_string(const std::string& name) {
    if (name == "CREATE") return OperationType::CREATE;
    if (name == "UPDATE") return OperationType::UPDATE;
    if (name == "DELETE") return OperationType::DELETE;
    return std::nullopt;
}

const char* entity_type_to_string(EntityType type) {
    switch (type) {
        case EntityType::TRIP: return "TRIP";
        case EntityType::VEHICLE: return "VEHICLE";
        case EntityType::EXPENSE: return "EXPENSE";
        case EntityType::USER_PROFILE: return "USER_PROFILE";
        default: return "UNKNOWN";
    }
}

std::optional<EntityType> entity_type_from_string(const std::string& name) {
    if (name == "TRIP") return EntityType::TRIP;
    if (name == "VEHICLE") return EntityType::VEHICLE;
    if (name == "EXPENSE") return EntityType::EXPENSE;
    if (name == "USER_PROFILE") return EntityType::USER_PROFILE;
    return std::nullopt;
}

const std::vector<EntityType>& all_entity_types() {
    static const std::vector<EntityType> types = {
        EntityType::TRIP,
        EntityType::VEHICLE,
        EntityType::EXPENSE,
        EntityType::USER_PROFILE,
    };
    return types;
}

nlohmann::json pending_operation_to_json(const PendingOperation& op) {
    nlohmann::json j;
    j["id"] = op.id;
    j["type"] = operation_type_to_string(op.type);
    j["entity_type"] = entity_type_to_string(op.entity_type);
    j["entity_id"] = op.entity_id;
    j["timestamp_ms"] = op.timestamp_ms;
    j["retry_count"] = op.retry_count;
    if (op.payload) {
        j["payload"] = *op.payload;
    }
    if (op.last_attempt_ms) {
        j["last_attempt_ms"] = *op.last_attempt_ms;
    } else {
        j["last_attempt_ms"] = nullptr;
    }
    if (!op.last_error.empty()) {
        j["last_error"] = op.last_error;
    }
    return j;
}

}  // namespace motium::sync
