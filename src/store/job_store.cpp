#include "job_store.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <sqlite3.h>
#include <fmt/format.h>
#include <memory>

// ── Row ────────────────────────────────────────────────────

void Row::set(const std::string& column, std::optional<std::string> value) {
    columns_[column] = std::move(value);
}

bool Row::has(const std::string& column) const {
    return columns_.count(column) > 0;
}

bool Row::is_null(const std::string& column) const {
    auto it = columns_.find(column);
    return it == columns_.end() || !it->second.has_value();
}

std::string Row::text(const std::string& column) const {
    auto it = columns_.find(column);
    if (it == columns_.end() || !it->second) return "";
    return *it->second;
}

int64_t Row::integer(const std::string& column, int64_t fallback) const {
    auto v = optional_integer(column);
    return v ? *v : fallback;
}

std::optional<int64_t> Row::optional_integer(const std::string& column) const {
    auto it = columns_.find(column);
    if (it == columns_.end() || !it->second) return std::nullopt;
    try {
        return std::stoll(*it->second);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ── JobStore ───────────────────────────────────────────────

namespace {

using DbHandle = std::unique_ptr<sqlite3, decltype(&sqlite3_close)>;
using StmtHandle = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

bool is_transient(int rc) {
    int primary = rc & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

int bind_params(sqlite3_stmt* stmt, const std::vector<SqlValue>& params) {
    for (size_t i = 0; i < params.size(); i++) {
        int idx = static_cast<int>(i) + 1;
        int rc = SQLITE_OK;
        if (std::holds_alternative<std::nullptr_t>(params[i])) {
            rc = sqlite3_bind_null(stmt, idx);
        } else if (const auto* iv = std::get_if<int64_t>(&params[i])) {
            rc = sqlite3_bind_int64(stmt, idx, *iv);
        } else {
            const auto& sv = std::get<std::string>(params[i]);
            rc = sqlite3_bind_text(stmt, idx, sv.c_str(), static_cast<int>(sv.size()),
                                   SQLITE_TRANSIENT);
        }
        if (rc != SQLITE_OK) return rc;
    }
    return SQLITE_OK;
}

} // namespace

JobStore::JobStore(const StoreConfig& config) : config_(config) {
}

JobStore::AttemptStatus JobStore::try_execute(const std::vector<Statement>& statements,
                                              QueryResult& out, std::string& error) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(config_.path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    DbHandle db(raw, &sqlite3_close);
    if (rc != SQLITE_OK) {
        error = fmt::format("cannot open {}: {}", config_.path,
                            raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc));
        if (is_transient(rc)) return AttemptStatus::TRANSIENT;
        throw StoreError(error);
    }
    sqlite3_busy_timeout(db.get(), config_.busy_timeout_secs * 1000);

    auto exec_plain = [&](const char* sql) {
        char* errmsg = nullptr;
        int r = sqlite3_exec(db.get(), sql, nullptr, nullptr, &errmsg);
        if (errmsg) {
            error = errmsg;
            sqlite3_free(errmsg);
        }
        return r;
    };

    rc = exec_plain("BEGIN DEFERRED");
    if (rc != SQLITE_OK) {
        if (is_transient(rc)) return AttemptStatus::TRANSIENT;
        throw StoreError("BEGIN failed: " + error);
    }

    // Roll back everything on any failure inside the batch
    auto fail = [&](int code, const std::string& msg) -> AttemptStatus {
        exec_plain("ROLLBACK");
        error = msg;
        if (is_transient(code)) return AttemptStatus::TRANSIENT;
        throw StoreError(msg);
    };

    QueryResult result;
    for (const auto& st : statements) {
        sqlite3_stmt* raw_stmt = nullptr;
        rc = sqlite3_prepare_v2(db.get(), st.sql.c_str(), -1, &raw_stmt, nullptr);
        StmtHandle stmt(raw_stmt, &sqlite3_finalize);
        if (rc != SQLITE_OK) {
            return fail(rc, fmt::format("prepare failed ({}): {}", sqlite3_errmsg(db.get()), st.sql));
        }
        if (!stmt) continue;  // empty statement

        rc = bind_params(stmt.get(), st.params);
        if (rc != SQLITE_OK) {
            std::string msg = fmt::format("bind failed ({}): {}", sqlite3_errmsg(db.get()), st.sql);
            stmt.reset();
            return fail(rc, msg);
        }

        std::vector<Row> rows;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Row row;
            int ncols = sqlite3_column_count(stmt.get());
            for (int c = 0; c < ncols; c++) {
                const char* name = sqlite3_column_name(stmt.get(), c);
                if (sqlite3_column_type(stmt.get(), c) == SQLITE_NULL) {
                    row.set(name, std::nullopt);
                } else {
                    const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(stmt.get(), c));
                    row.set(name, std::string(txt ? txt : ""));
                }
            }
            rows.push_back(std::move(row));
        }
        if (rc != SQLITE_DONE) {
            std::string msg = fmt::format("step failed ({}): {}", sqlite3_errmsg(db.get()), st.sql);
            stmt.reset();
            return fail(rc, msg);
        }
        result.rows = std::move(rows);
    }

    result.last_insert_id = sqlite3_last_insert_rowid(db.get());

    rc = exec_plain("COMMIT");
    if (rc != SQLITE_OK) {
        return fail(rc, "COMMIT failed: " + error);
    }

    out = std::move(result);
    return AttemptStatus::OK;
}

QueryResult JobStore::execute(const std::vector<Statement>& statements) {
    int consecutive = 0;
    while (true) {
        QueryResult result;
        std::string error;
        if (try_execute(statements, result, error) == AttemptStatus::OK) {
            return result;
        }

        consecutive++;
        if (consecutive >= config_.warn_after_failures) {
            log_warning("store", fmt::format(
                "Couldn't access {} for {} attempts. Will continue trying. Error: {}",
                config_.path, consecutive, error));
            consecutive = 0;
        }
        platform::sleep_ms(config_.retry_delay_ms);
    }
}

QueryResult JobStore::execute(const Statement& statement) {
    return execute(std::vector<Statement>{statement});
}

std::vector<Row> JobStore::query(const Statement& statement) {
    return execute(statement).rows;
}

void JobStore::initialize_schema() {
    execute(std::vector<Statement>{
        "CREATE TABLE IF NOT EXISTS requests ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  guid TEXT NOT NULL UNIQUE,"
        "  status TEXT NOT NULL,"
        "  size INTEGER,"
        "  details TEXT,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL)",
        "CREATE TABLE IF NOT EXISTS downloads ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  request_id INTEGER NOT NULL REFERENCES requests(id),"
        "  remote_filename TEXT NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  status TEXT NOT NULL,"
        "  size INTEGER,"
        "  details TEXT,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL,"
        "  UNIQUE(request_id, remote_filename))",
        "CREATE TABLE IF NOT EXISTS download_attempts ("
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  download_id INTEGER NOT NULL REFERENCES downloads(id),"
        "  status TEXT,"
        "  details TEXT,"
        "  created_at TEXT NOT NULL,"
        "  updated_at TEXT NOT NULL)",
        "CREATE INDEX IF NOT EXISTS idx_downloads_request ON downloads(request_id)",
        "CREATE INDEX IF NOT EXISTS idx_attempts_download ON download_attempts(download_id)",
    });
}
