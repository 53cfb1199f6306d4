#include "postgres_client.hpp"

#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

namespace motium::offline {

PostgresRow::PostgresRow(const PGresult* result, int row)
    : result_(result), row_(row) {}

std::string PostgresRow::get_string(int col) const {
    if (col < 0 || PQgetisnull(result_, row_, col)) {
        return "";
    }
    return PQgetvalue(result_, row_, col);
}

std::string PostgresRow::get_string(const std::string& col_name) const {
    return get_string(column_index(col_name));
}

int64_t PostgresRow::get_int64(int col) const {
    if (col < 0 || PQgetisnull(result_, row_, col)) {
        return 0;
    }
    return std::stoll(PQgetvalue(result_, row_, col));
}

int64_t PostgresRow::get_int64(const std::string& col_name) const {
    return get_int64(column_index(col_name));
}

std::optional<int64_t> PostgresRow::get_optional_int64(
    const std::string& col_name) const {
    int col = column_index(col_name);
    if (is_null(col)) {
        return std::nullopt;
    }
    return get_int64(col);
}

bool PostgresRow::get_bool(const std::string& col_name) const {
    std::string value = get_string(col_name);
    return value == "t" || value == "true";
}

bool PostgresRow::is_null(int col) const {
    return col < 0 || PQgetisnull(result_, row_, col) == 1;
}

bool PostgresRow::is_null(const std::string& col_name) const {
    return is_null(column_index(col_name));
}

int PostgresRow::column_index(const std::string& col_name) const {
    int col = PQfnumber(result_, col_name.c_str());
    if (col < 0) {
        LOG(WARNING) << "Column not found: " << col_name;
    }
    return col;
}

PostgresResult::PostgresResult(PGresult* result) : result_(result) {}

PostgresResult::~PostgresResult() {
    if (result_) {
        PQclear(result_);
    }
}

PostgresResult::PostgresResult(PostgresResult&& other) noexcept
    : result_(other.result_) {
    other.result_ = nullptr;
}

PostgresResult& PostgresResult::operator=(PostgresResult&& other) noexcept {
    if (this != &other) {
        if (result_) {
            PQclear(result_);
        }
        result_ = other.result_;
        other.result_ = nullptr;
    }
    return *this;
}

bool PostgresResult::ok() const {
    if (!result_) return false;
    ExecStatusType status = PQresultStatus(result_);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

std::string PostgresResult::error() const {
    if (!result_) return "no result (connection unavailable)";
    return PQresultErrorMessage(result_);
}

int PostgresResult::num_rows() const {
    return result_ ? PQntuples(result_) : 0;
}

PostgresRow PostgresResult::row(int index) const {
    return PostgresRow(result_, index);
}

int PostgresResult::affected_rows() const {
    if (!result_) return 0;
    const char* val = PQcmdTuples(result_);
    if (!val || val[0] == '\0') return 0;
    return std::stoi(val);
}

PostgresResult::Iterator::Iterator(const PostgresResult* result, int row)
    : result_(result), row_(row) {}

PostgresRow PostgresResult::Iterator::operator*() const {
    return result_->row(row_);
}

PostgresResult::Iterator& PostgresResult::Iterator::operator++() {
    ++row_;
    return *this;
}

bool PostgresResult::Iterator::operator!=(const Iterator& other) const {
    return row_ != other.row_;
}

PostgresResult::Iterator PostgresResult::begin() const {
    return Iterator(this, 0);
}

PostgresResult::Iterator PostgresResult::end() const {
    return Iterator(this, num_rows());
}

PostgresClient::PostgresClient(const PostgresConfig& config)
    : config_(config) {
    connect();
}

PostgresClient::~PostgresClient() {
    if (conn_) {
        PQfinish(conn_);
    }
}

void PostgresClient::connect() {
    std::ostringstream conn_str;
    conn_str << "host=" << config_.host
             << " port=" << config_.port
             << " dbname=" << config_.database
             << " user=" << config_.user
             << " password=" << config_.password
             << " connect_timeout=" << config_.connect_timeout;
    if (config_.statement_timeout_ms > 0) {
        conn_str << " options='-c statement_timeout="
                 << config_.statement_timeout_ms << "'";
    }

    conn_ = PQconnectdb(conn_str.str().c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        LOG(ERROR) << "PostgreSQL connection failed: " << PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
    } else {
        LOG(INFO) << "Offline store connected: " << config_.database
                  << "@" << config_.host << ":" << config_.port;
    }
}

bool PostgresClient::is_connected() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

bool PostgresClient::reconnect() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
    connect();
    return conn_ != nullptr;
}

bool PostgresClient::ensure_connected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
        return true;
    }
    LOG(WARNING) << "Offline store connection lost, reconnecting";
    return reconnect();
}

PostgresResult PostgresClient::execute(const std::string& query) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!ensure_connected()) {
        return PostgresResult(nullptr);
    }

    PostgresResult res(PQexec(conn_, query.c_str()));
    if (!res.ok()) {
        LOG(ERROR) << "Query failed: " << res.error();
    }
    return res;
}

PostgresResult PostgresClient::execute(
    const std::string& query,
    const std::vector<std::optional<std::string>>& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!ensure_connected()) {
        return PostgresResult(nullptr);
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    PostgresResult res(PQexecParams(conn_,
                                    query.c_str(),
                                    static_cast<int>(values.size()),
                                    nullptr,  // server infers types
                                    values.data(),
                                    nullptr,
                                    nullptr,
                                    0));      // text results
    if (!res.ok()) {
        LOG(ERROR) << "Query failed: " << res.error();
    }
    return res;
}

std::optional<std::string> PostgresClient::execute_scalar(
    const std::string& query,
    const std::vector<std::optional<std::string>>& params) {
    auto result = execute(query, params);
    if (result.ok() && result.num_rows() > 0 && !result.row(0).is_null(0)) {
        return result.row(0).get_string(0);
    }
    return std::nullopt;
}

bool PostgresClient::with_transaction(const std::function<bool()>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!execute("BEGIN").ok()) {
        return false;
    }

    bool committed = false;
    try {
        if (fn()) {
            committed = execute("COMMIT").ok();
            if (!committed) {
                execute("ROLLBACK");
            }
            return committed;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Transaction aborted: " << e.what();
        execute("ROLLBACK");
        throw;
    }

    execute("ROLLBACK");
    return false;
}

std::string PostgresClient::last_error() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return conn_ ? PQerrorMessage(conn_) : "not connected";
}

}  // namespace motium::offline
