#include "sqlite_adapter.hpp"
#include "tracker_log.hpp"
#include <stdexcept>

namespace arena_tracker {

namespace {

// Finalizes a prepared statement on scope exit
struct StatementGuard {
    sqlite3_stmt* stmt;
    ~StatementGuard() { sqlite3_finalize(stmt); }
};

const SqlValue* find_column(const SqlRow& row, const std::string& column) {
    auto it = row.find(column);
    return it != row.end() ? &it->second : nullptr;
}

} // namespace

std::optional<std::string> row_text(const SqlRow& row, const std::string& column) {
    const SqlValue* value = find_column(row, column);
    if (!value) return std::nullopt;
    if (auto* s = std::get_if<std::string>(value)) return *s;
    if (auto* i = std::get_if<int64_t>(value)) return std::to_string(*i);
    return std::nullopt;
}

std::optional<int64_t> row_int(const SqlRow& row, const std::string& column) {
    const SqlValue* value = find_column(row, column);
    if (!value) return std::nullopt;
    if (auto* i = std::get_if<int64_t>(value)) return *i;
    if (auto* d = std::get_if<double>(value)) return static_cast<int64_t>(*d);
    return std::nullopt;
}

std::optional<double> row_real(const SqlRow& row, const std::string& column) {
    const SqlValue* value = find_column(row, column);
    if (!value) return std::nullopt;
    if (auto* d = std::get_if<double>(value)) return *d;
    if (auto* i = std::get_if<int64_t>(value)) return static_cast<double>(*i);
    return std::nullopt;
}

SqliteAdapter::SqliteAdapter(const std::string& db_path) : path_(db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + err);
    }

    exec("PRAGMA journal_mode=WAL");
    exec("PRAGMA synchronous=NORMAL");

    init_schema();
}

SqliteAdapter::~SqliteAdapter() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteAdapter::exec(const std::string& sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string error_msg = err ? err : "Unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQL error: " + error_msg);
    }
}

void SqliteAdapter::init_schema() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS grp_id_cache (
            grp_id INTEGER PRIMARY KEY,
            card_name TEXT NOT NULL,
            scryfall_id TEXT,
            image_uri_small TEXT,
            image_uri_normal TEXT,
            mana_cost TEXT,
            cmc REAL,
            type_line TEXT,
            oracle_text TEXT,
            source TEXT,
            updated_at TEXT DEFAULT (datetime('now'))
        )
    )");

    // Card catalog; normally populated by a separate importer
    exec(R"(
        CREATE TABLE IF NOT EXISTS cards (
            id TEXT PRIMARY KEY,
            name TEXT NOT NULL,
            mana_cost TEXT,
            cmc REAL,
            type_line TEXT,
            oracle_text TEXT,
            image_uri_small TEXT,
            image_uri_normal TEXT,
            arena_id INTEGER
        )
    )");

    exec("CREATE INDEX IF NOT EXISTS idx_cards_arena_id ON cards(arena_id)");
}

sqlite3_stmt* SqliteAdapter::prepare(const std::string& sql, const SqlParams& params) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
    }

    int index = 1;
    for (const auto& param : params) {
        if (auto* i = std::get_if<int64_t>(&param)) {
            sqlite3_bind_int64(stmt, index, *i);
        } else if (auto* d = std::get_if<double>(&param)) {
            sqlite3_bind_double(stmt, index, *d);
        } else if (auto* s = std::get_if<std::string>(&param)) {
            sqlite3_bind_text(stmt, index, s->c_str(), -1, SQLITE_TRANSIENT);
        } else {
            sqlite3_bind_null(stmt, index);
        }
        ++index;
    }
    return stmt;
}

SqlRow SqliteAdapter::read_row(sqlite3_stmt* stmt) {
    SqlRow row;
    int columns = sqlite3_column_count(stmt);
    for (int i = 0; i < columns; ++i) {
        std::string name = sqlite3_column_name(stmt, i);
        switch (sqlite3_column_type(stmt, i)) {
            case SQLITE_INTEGER:
                row[name] = static_cast<int64_t>(sqlite3_column_int64(stmt, i));
                break;
            case SQLITE_FLOAT:
                row[name] = sqlite3_column_double(stmt, i);
                break;
            case SQLITE_TEXT:
                row[name] = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, i)));
                break;
            default:
                row[name] = nullptr;
                break;
        }
    }
    return row;
}

int SqliteAdapter::execute(const std::string& sql, const SqlParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StatementGuard guard{prepare(sql, params)};
    int rc = sqlite3_step(guard.stmt);
    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw std::runtime_error("Failed to execute statement: " + std::string(sqlite3_errmsg(db_)));
    }
    return sqlite3_changes(db_);
}

std::optional<SqlRow> SqliteAdapter::query_one(const std::string& sql, const SqlParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StatementGuard guard{prepare(sql, params)};
    int rc = sqlite3_step(guard.stmt);
    if (rc == SQLITE_ROW) {
        return read_row(guard.stmt);
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return std::nullopt;
}

std::vector<SqlRow> SqliteAdapter::query_all(const std::string& sql, const SqlParams& params) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    StatementGuard guard{prepare(sql, params)};
    std::vector<SqlRow> rows;
    int rc;
    while ((rc = sqlite3_step(guard.stmt)) == SQLITE_ROW) {
        rows.push_back(read_row(guard.stmt));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("Query failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return rows;
}

void SqliteAdapter::transaction(const std::function<void()>& fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    exec("BEGIN");
    try {
        fn();
    } catch (const std::exception& e) {
        TrackerLog::warn("Storage", std::string("Rolling back transaction: ") + e.what());
        exec("ROLLBACK");
        throw;
    }
    exec("COMMIT");
}

} // namespace arena_tracker
