#pragma once

#include <memory>
#include <optional>

#include "postgres_client.hpp"
#include "session_store.hpp"

namespace motium::offline {

/// Single-row session table. Encryption at rest is left to the database
/// deployment (e.g. an encrypted volume).
class PostgresSessionStore : public sync::SessionStore {
public:
    PostgresSessionStore(std::shared_ptr<PostgresClient> db,
                         std::shared_ptr<sync::Clock> clock);

    bool ensure_schema();

    std::optional<sync::Session> load() override;
    bool save(const sync::Session& session) override;
    bool clear() override;

private:
    std::shared_ptr<PostgresClient> db_;
};

}  // namespace motium::offline
