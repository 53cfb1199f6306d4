#include "postgres_session_store.hpp"

#include <glog/logging.h>

namespace motium::offline {

PostgresSessionStore::PostgresSessionStore(std::shared_ptr<PostgresClient> db,
                                           std::shared_ptr<sync::Clock> clock)
    : SessionStore(std::move(clock)), db_(std::move(db)) {}

bool PostgresSessionStore::ensure_schema() {
    auto result = db_->execute(R"(
        CREATE TABLE IF NOT EXISTS session_store (
            slot SMALLINT PRIMARY KEY DEFAULT 1 CHECK (slot = 1),
            access_token TEXT NOT NULL,
            refresh_token TEXT NOT NULL DEFAULT '',
            expires_at_ms BIGINT NOT NULL DEFAULT 0,
            user_id TEXT NOT NULL DEFAULT '',
            user_email TEXT NOT NULL DEFAULT '',
            token_type TEXT NOT NULL DEFAULT 'Bearer',
            created_at_ms BIGINT NOT NULL DEFAULT 0
        )
    )");
    if (!result.ok()) {
        LOG(ERROR) << "Failed to create session_store: " << result.error();
        return false;
    }
    return true;
}

std::optional<sync::Session> PostgresSessionStore::load() {
    auto result = db_->execute(R"(
        SELECT access_token, refresh_token, expires_at_ms, user_id, user_email,
               token_type, created_at_ms
        FROM session_store WHERE slot = 1
    )");
    if (!result.ok() || result.num_rows() == 0) {
        return std::nullopt;
    }

    auto row = result.row(0);
    sync::Session session;
    session.access_token = row.get_string("access_token");
    session.refresh_token = row.get_string("refresh_token");
    session.expires_at_ms = row.get_int64("expires_at_ms");
    session.user_id = row.get_string("user_id");
    session.user_email = row.get_string("user_email");
    session.token_type = row.get_string("token_type");
    session.created_at_ms = row.get_int64("created_at_ms");
    return session;
}

bool PostgresSessionStore::save(const sync::Session& session) {
    auto result = db_->execute(R"(
        INSERT INTO session_store (slot, access_token, refresh_token, expires_at_ms,
                                   user_id, user_email, token_type, created_at_ms)
        VALUES (1, $1, $2, $3, $4, $5, $6, $7)
        ON CONFLICT (slot) DO UPDATE SET
            access_token = EXCLUDED.access_token,
            refresh_token = EXCLUDED.refresh_token,
            expires_at_ms = EXCLUDED.expires_at_ms,
            user_id = EXCLUDED.user_id,
            user_email = EXCLUDED.user_email,
            token_type = EXCLUDED.token_type,
            created_at_ms = EXCLUDED.created_at_ms
    )", {
        session.access_token,
        session.refresh_token,
        std::to_string(session.expires_at_ms),
        session.user_id,
        session.user_email,
        session.token_type,
        std::to_string(session.created_at_ms)
    });
    return result.ok();
}

bool PostgresSessionStore::clear() {
    return db_->execute("DELETE FROM session_store").ok();
}

}  // namespace motium::offline
