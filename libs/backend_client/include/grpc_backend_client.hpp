#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <grpcpp/grpcpp.h>

#include "auth_endpoint.hpp"
#include "remote_api.hpp"
#include "session_store.hpp"
#include "sync_errors.hpp"
#include "sync_types.hpp"

#include "motium-sync-backend-service.grpc.pb.h"

namespace motium::offline {

namespace proto = motium::sync_backend_service;

struct BackendClientConfig {
    std::string address = "localhost:50070";
    /// gRPC deadline per call
    std::chrono::milliseconds call_deadline{20000};
};

/// Map a gRPC status onto the sync error taxonomy
sync::ErrorKind classify_status(const grpc::Status& status);

/// Throw RemoteError for a failed status
void throw_on_error(const grpc::Status& status, const std::string& what);

proto::entity_type_t entity_type_to_proto(sync::EntityType entity_type);
std::optional<sync::EntityType> entity_type_from_proto(proto::entity_type_t entity_type);

void record_to_proto(const sync::EntityRecord& record, proto::entity_record_t* out);

/// Throws RemoteError(PERMANENT) for unknown types or malformed payload JSON
sync::EntityRecord record_from_proto(const proto::entity_record_t& record);

/// RemoteApi over the backend gRPC services. Calls carry the current
/// access token as a bearer credential.
class GrpcRemoteApi : public sync::RemoteApi {
public:
    GrpcRemoteApi(std::shared_ptr<grpc::Channel> channel,
                  std::shared_ptr<sync::SessionStore> session_store,
                  BackendClientConfig config = BackendClientConfig{});

    void push_entity(const sync::EntityRecord& record) override;
    void delete_entity(sync::EntityType entity_type, const std::string& entity_id) override;
    sync::PullResult pull_entities(sync::EntityType entity_type, int64_t since_ms) override;

private:
    void prepare(grpc::ClientContext& context) const;

    std::shared_ptr<sync::SessionStore> session_store_;
    BackendClientConfig config_;
    std::unique_ptr<proto::push_entity_service::Stub> push_stub_;
    std::unique_ptr<proto::delete_entity_service::Stub> delete_stub_;
    std::unique_ptr<proto::pull_entities_service::Stub> pull_stub_;
};

/// AuthEndpoint over refresh_session_service. A rejected refresh token
/// (UNAUTHENTICATED / PERMISSION_DENIED) is a permanent failure.
class GrpcAuthEndpoint : public sync::AuthEndpoint {
public:
    GrpcAuthEndpoint(std::shared_ptr<grpc::Channel> channel,
                     BackendClientConfig config = BackendClientConfig{});

    sync::Session refresh_session(const sync::Session& current) override;

private:
    BackendClientConfig config_;
    std::unique_ptr<proto::refresh_session_service::Stub> stub_;
};

}  // namespace motium::offline
