#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>
#include <core/types.hpp>

// A bound parameter: NULL, integer, or text.
using SqlValue = std::variant<std::nullptr_t, int64_t, std::string>;

struct Statement {
    std::string sql;
    std::vector<SqlValue> params;

    Statement(const char* s) : sql(s) {}
    Statement(std::string s) : sql(std::move(s)) {}
    Statement(std::string s, std::vector<SqlValue> p)
        : sql(std::move(s)), params(std::move(p)) {}
};

// One result row, addressed by column name. NULL columns are kept distinct
// from empty strings.
class Row {
public:
    void set(const std::string& column, std::optional<std::string> value);

    bool has(const std::string& column) const;
    bool is_null(const std::string& column) const;
    std::string text(const std::string& column) const;          // "" if NULL
    int64_t integer(const std::string& column, int64_t fallback = 0) const;
    std::optional<int64_t> optional_integer(const std::string& column) const;

private:
    std::map<std::string, std::optional<std::string>> columns_;
};

struct QueryResult {
    int64_t last_insert_id = 0;   // 0 if the batch inserted nothing
    std::vector<Row> rows;        // rows of the last statement
};

// Non-transient store failure (bad SQL, constraint violation, cannot open).
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

// SQLite-backed job-tracking store shared by every pipeline process.
//
// Every execute() opens its own connection and runs the whole batch inside
// one transaction: either every statement commits or none does. Lock
// contention (SQLITE_BUSY / SQLITE_LOCKED) rolls the batch back and retries
// it after a fixed delay, forever; a warning is logged each time
// `warn_after_failures` consecutive attempts have failed.
class JobStore {
public:
    explicit JobStore(const StoreConfig& config);

    QueryResult execute(const std::vector<Statement>& statements);
    QueryResult execute(const Statement& statement);

    // Shorthand for execute(statement).rows
    std::vector<Row> query(const Statement& statement);

    // Create the requests / downloads / download_attempts tables if absent.
    void initialize_schema();

    const std::string& path() const { return config_.path; }

private:
    StoreConfig config_;

    enum class AttemptStatus { OK, TRANSIENT };
    AttemptStatus try_execute(const std::vector<Statement>& statements,
                              QueryResult& out, std::string& error);
};
