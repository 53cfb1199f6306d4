#include "grpc_backend_client.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>

namespace motium::offline {

using sync::EntityRecord;
using sync::EntityType;
using sync::ErrorKind;
using sync::RemoteError;

ErrorKind classify_status(const grpc::Status& status) {
    switch (status.error_code()) {
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
        case grpc::StatusCode::ABORTED:
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::UNKNOWN:
        case grpc::StatusCode::CANCELLED:
            return ErrorKind::TRANSIENT;
        case grpc::StatusCode::UNAUTHENTICATED:
            return ErrorKind::AUTH;
        // Authenticated but not allowed to touch this entity
        case grpc::StatusCode::PERMISSION_DENIED:
        default:
            return ErrorKind::PERMANENT;
    }
}

void throw_on_error(const grpc::Status& status, const std::string& what) {
    if (status.ok()) {
        return;
    }
    throw RemoteError(classify_status(status),
                      what + " failed: [" + std::to_string(status.error_code()) + "] " +
                          status.error_message());
}

proto::entity_type_t entity_type_to_proto(EntityType entity_type) {
    switch (entity_type) {
        case EntityType::TRIP: return proto::TRIP;
        case EntityType::VEHICLE: return proto::VEHICLE;
        case EntityType::EXPENSE: return proto::EXPENSE;
        case EntityType::USER_PROFILE: return proto::USER_PROFILE;
        default: return proto::ENTITY_UNSPECIFIED;
    }
}

std::optional<EntityType> entity_type_from_proto(proto::entity_type_t entity_type) {
    switch (entity_type) {
        case proto::TRIP: return EntityType::TRIP;
        case proto::VEHICLE: return EntityType::VEHICLE;
        case proto::EXPENSE: return EntityType::EXPENSE;
        case proto::USER_PROFILE: return EntityType::USER_PROFILE;
        default: return std::nullopt;
    }
}

void record_to_proto(const EntityRecord& record, proto::entity_record_t* out) {
    out->set_entity_type(entity_type_to_proto(record.entity_type));
    out->set_entity_id(record.entity_id);
    out->set_payload_json(record.payload.dump());
    out->set_updated_at_ms(record.updated_at_ms);
    out->set_deleted(record.deleted);
}

EntityRecord record_from_proto(const proto::entity_record_t& record) {
    auto entity_type = entity_type_from_proto(record.entity_type());
    if (!entity_type) {
        throw RemoteError(ErrorKind::PERMANENT,
                          "backend sent unknown entity type " +
                              std::to_string(record.entity_type()));
    }

    EntityRecord result;
    result.entity_type = *entity_type;
    result.entity_id = record.entity_id();
    result.updated_at_ms = record.updated_at_ms();
    result.deleted = record.deleted();
    if (!record.payload_json().empty()) {
        try {
            result.payload = nlohmann::json::parse(record.payload_json());
        } catch (const nlohmann::json::parse_error& e) {
            throw RemoteError(ErrorKind::PERMANENT,
                              "malformed payload for " + record.entity_id() + ": " + e.what());
        }
    }
    return result;
}

GrpcRemoteApi::GrpcRemoteApi(std::shared_ptr<grpc::Channel> channel,
                             std::shared_ptr<sync::SessionStore> session_store,
                             BackendClientConfig config)
    : session_store_(std::move(session_store)),
      config_(std::move(config)),
      push_stub_(proto::push_entity_service::NewStub(channel)),
      delete_stub_(proto::delete_entity_service::NewStub(channel)),
      pull_stub_(proto::pull_entities_service::NewStub(channel)) {}

void GrpcRemoteApi::prepare(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + config_.call_deadline);
    auto session = session_store_->load();
    if (session && !session->access_token.empty()) {
        std::string token_type = session->token_type.empty() ? "Bearer" : session->token_type;
        context.AddMetadata("authorization", token_type + " " + session->access_token);
    }
}

void GrpcRemoteApi::push_entity(const EntityRecord& record) {
    proto::push_entity_request request;
    record_to_proto(record, request.mutable_record());

    proto::push_entity_response response;
    grpc::ClientContext context;
    prepare(context);

    grpc::Status status = push_stub_->push_entity(&context, request, &response);
    throw_on_error(status, "push " + record.entity_id);
    VLOG(2) << "Pushed " << sync::entity_type_to_string(record.entity_type) << " "
            << record.entity_id;
}

void GrpcRemoteApi::delete_entity(EntityType entity_type, const std::string& entity_id) {
    proto::delete_entity_request request;
    request.set_entity_type(entity_type_to_proto(entity_type));
    request.set_entity_id(entity_id);

    proto::delete_entity_response response;
    grpc::ClientContext context;
    prepare(context);

    grpc::Status status = delete_stub_->delete_entity(&context, request, &response);
    if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
        VLOG(1) << "Delete of " << entity_id << ": already gone on the backend";
        return;
    }
    throw_on_error(status, "delete " + entity_id);
}

sync::PullResult GrpcRemoteApi::pull_entities(EntityType entity_type, int64_t since_ms) {
    proto::pull_entities_request request;
    request.set_entity_type(entity_type_to_proto(entity_type));
    request.set_since_ms(since_ms);

    proto::pull_entities_response response;
    grpc::ClientContext context;
    prepare(context);

    grpc::Status status = pull_stub_->pull_entities(&context, request, &response);
    throw_on_error(status, std::string("pull ") + sync::entity_type_to_string(entity_type));

    sync::PullResult result;
    result.server_time_ms = response.server_time_ms();
    result.records.reserve(response.records_size());
    for (const auto& record : response.records()) {
        result.records.push_back(record_from_proto(record));
    }
    return result;
}

GrpcAuthEndpoint::GrpcAuthEndpoint(std::shared_ptr<grpc::Channel> channel,
                                   BackendClientConfig config)
    : config_(std::move(config)),
      stub_(proto::refresh_session_service::NewStub(channel)) {}

sync::Session GrpcAuthEndpoint::refresh_session(const sync::Session& current) {
    proto::refresh_session_request request;
    request.set_refresh_token(current.refresh_token);
    request.set_user_id(current.user_id);

    proto::refresh_session_response response;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + config_.call_deadline);

    grpc::Status status = stub_->refresh_session(&context, request, &response);
    if (!status.ok()) {
        ErrorKind kind = classify_status(status);
        // A refresh token the backend refuses will not become valid by retrying
        if (kind == ErrorKind::AUTH) {
            kind = ErrorKind::PERMANENT;
        }
        throw RemoteError(kind, "session refresh failed: [" +
                                    std::to_string(status.error_code()) + "] " +
                                    status.error_message());
    }

    const auto& fresh = response.session();
    sync::Session session;
    session.access_token = fresh.access_token();
    session.refresh_token = fresh.refresh_token();
    session.expires_at_ms = fresh.expires_at_ms();
    session.user_id = fresh.user_id();
    session.user_email = fresh.user_email();
    session.token_type = fresh.token_type().empty() ? "Bearer" : fresh.token_type();
    return session;
}

}  // namespace motium::offline
