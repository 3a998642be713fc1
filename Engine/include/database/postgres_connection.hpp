/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <stdexcept>
#include <libpq-fe.h>

namespace Instasave {

struct DbConfig;

/**
 * @brief Failed statement or connection, with the server's SQLSTATE when known
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(const std::string& message, std::string sqlstate = {})
        : std::runtime_error(message), sqlstate_(std::move(sqlstate)) {}

    const std::string& sqlstate() const { return sqlstate_; }

    /**
     * @brief SQLSTATE 23505 (unique_violation)
     */
    bool is_unique_violation() const { return sqlstate_ == "23505"; }

private:
    std::string sqlstate_;
};

/**
 * @brief PostgreSQL connection wrapper
 *
 * Not thread-safe; callers that share a connection must serialize access.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using a DbConfig (PG* environment already merged)
     */
    explicit PostgresConnection(const DbConfig& config);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    bool is_connected() const;

    /**
     * @brief Execute query (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query with params and return the first column of the first row
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Execute query with params and iterate rows
     * @param callback Called for each row: callback(row_data)
     */
    void query(const std::string& sql, const std::vector<std::string>& params,
               std::function<void(const std::vector<std::string>&)> callback);

    void begin();
    void commit();
    void rollback();

    /**
     * @brief RAII transaction guard; rolls back unless commit() was called
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void require_connection() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
};

} // namespace Instasave
