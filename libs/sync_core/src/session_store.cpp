#include "session_store.hpp"

#include <glog/logging.h>

namespace motium::sync {

namespace {
constexpr int64_t kMillisPerMinute = 60000;
}

SessionStore::SessionStore(std::shared_ptr<Clock> clock)
    : clock_(std::move(clock)) {}

bool SessionStore::save_session(const std::string& access_token, int64_t expires_at_ms) {
    Session session = load().value_or(Session{});
    if (session.created_at_ms == 0) {
        session.created_at_ms = clock_->now_ms();
    }
    session.access_token = access_token;
    session.expires_at_ms = expires_at_ms;
    return save(session);
}

bool SessionStore::has_session() {
    auto session = load();
    return session && !session->access_token.empty();
}

bool SessionStore::is_token_expired() {
    int64_t expires_at = get_expires_at().value_or(0);
    return clock_->now_ms() >= expires_at;
}

bool SessionStore::is_token_expiring_soon(int minutes) {
    int64_t expires_at = get_expires_at().value_or(0);
    return expires_at - clock_->now_ms() < minutes * kMillisPerMinute;
}

bool SessionStore::has_valid_session() {
    return has_session() && !is_token_expired();
}

std::optional<std::string> SessionStore::get_access_token() {
    auto session = load();
    if (!session || session->access_token.empty()) {
        return std::nullopt;
    }
    return session->access_token;
}

std::optional<std::string> SessionStore::get_refresh_token() {
    auto session = load();
    if (!session || session->refresh_token.empty()) {
        return std::nullopt;
    }
    return session->refresh_token;
}

std::optional<int64_t> SessionStore::get_expires_at() {
    auto session = load();
    if (!session || session->access_token.empty()) {
        return std::nullopt;
    }
    return session->expires_at_ms;
}

InMemorySessionStore::InMemorySessionStore(std::shared_ptr<Clock> clock)
    : SessionStore(std::move(clock)) {}

std::optional<Session> InMemorySessionStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

bool InMemorySessionStore::save(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    VLOG(1) << "Session saved, expires_at=" << session.expires_at_ms;
    return true;
}

bool InMemorySessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.reset();
    return true;
}

}  // namespace motium::sync
