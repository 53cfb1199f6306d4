#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <libpq-fe.h>

namespace motium::offline {

/// Connection settings for the local PostgreSQL store
struct PostgresConfig {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "motium_offline";
    std::string user = "motium";
    std::string password = "motium_dev";
    int connect_timeout = 10;
    /// Server-side statement timeout in milliseconds, 0 disables it
    int statement_timeout_ms = 5000;
};

/// Read-only view on one row of a result. Valid while the result lives.
class PostgresRow {
public:
    PostgresRow(const PGresult* result, int row);

    /// Column as text, empty string for NULL
    std::string get_string(int col) const;
    std::string get_string(const std::string& col_name) const;

    /// Column as integer, 0 for NULL
    int64_t get_int64(int col) const;
    int64_t get_int64(const std::string& col_name) const;

    /// Column as integer, nullopt for NULL
    std::optional<int64_t> get_optional_int64(const std::string& col_name) const;

    /// Column as boolean ('t' / 'f' text form), false for NULL
    bool get_bool(const std::string& col_name) const;

    bool is_null(int col) const;
    bool is_null(const std::string& col_name) const;

private:
    int column_index(const std::string& col_name) const;

    const PGresult* result_;
    int row_;
};

/// Owning wrapper around PGresult
class PostgresResult {
public:
    explicit PostgresResult(PGresult* result);
    ~PostgresResult();

    PostgresResult(PostgresResult&& other) noexcept;
    PostgresResult& operator=(PostgresResult&& other) noexcept;

    PostgresResult(const PostgresResult&) = delete;
    PostgresResult& operator=(const PostgresResult&) = delete;

    bool ok() const;
    std::string error() const;

    int num_rows() const;
    PostgresRow row(int index) const;

    /// Rows touched by INSERT/UPDATE/DELETE
    int affected_rows() const;

    class Iterator {
    public:
        Iterator(const PostgresResult* result, int row);
        PostgresRow operator*() const;
        Iterator& operator++();
        bool operator!=(const Iterator& other) const;

    private:
        const PostgresResult* result_;
        int row_;
    };

    Iterator begin() const;
    Iterator end() const;

private:
    PGresult* result_;
};

/// Single-connection PostgreSQL client shared by the offline stores.
///
/// All calls are serialised on an internal recursive mutex, so several
/// stores may share one client across threads. with_transaction() holds
/// that mutex for the whole transaction.
class PostgresClient {
public:
    explicit PostgresClient(const PostgresConfig& config);
    ~PostgresClient();

    PostgresClient(const PostgresClient&) = delete;
    PostgresClient& operator=(const PostgresClient&) = delete;

    bool is_connected() const;

    /// Drop the current connection and connect again
    bool reconnect();

    PostgresResult execute(const std::string& query);

    /// Parameterised query ($1, $2, ...). nullopt parameters are sent as NULL.
    PostgresResult execute(const std::string& query,
                           const std::vector<std::optional<std::string>>& params);

    /// First column of the first row, nullopt when there is no row
    std::optional<std::string> execute_scalar(
        const std::string& query,
        const std::vector<std::optional<std::string>>& params = {});

    /// Run fn inside BEGIN/COMMIT. fn returning false (or throwing) rolls back.
    bool with_transaction(const std::function<bool()>& fn);

    std::string last_error() const;

private:
    void connect();
    bool ensure_connected();

    PostgresConfig config_;
    PGconn* conn_ = nullptr;
    mutable std::recursive_mutex mutex_;
};

}  // namespace motium::offline
