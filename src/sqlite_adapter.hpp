#pragma once

#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arena_tracker {

using SqlValue = std::variant<std::nullptr_t, int64_t, double, std::string>;
using SqlParams = std::vector<SqlValue>;
using SqlRow = std::map<std::string, SqlValue>;

// Typed accessors for a column that may be NULL or absent
std::optional<std::string> row_text(const SqlRow& row, const std::string& column);
std::optional<int64_t> row_int(const SqlRow& row, const std::string& column);
std::optional<double> row_real(const SqlRow& row, const std::string& column);

// Thin parameterised-query layer over one SQLite connection.
// All calls are serialised; errors throw std::runtime_error.
class SqliteAdapter {
public:
    explicit SqliteAdapter(const std::string& db_path);
    ~SqliteAdapter();

    // Non-copyable
    SqliteAdapter(const SqliteAdapter&) = delete;
    SqliteAdapter& operator=(const SqliteAdapter&) = delete;

    // Runs a statement, returns the number of rows changed
    int execute(const std::string& sql, const SqlParams& params = {});

    std::optional<SqlRow> query_one(const std::string& sql, const SqlParams& params = {});
    std::vector<SqlRow> query_all(const std::string& sql, const SqlParams& params = {});

    // Runs fn inside BEGIN/COMMIT, rolling back if it throws
    void transaction(const std::function<void()>& fn);

    const std::string& path() const { return path_; }

private:
    void init_schema();
    void exec(const std::string& sql);
    sqlite3_stmt* prepare(const std::string& sql, const SqlParams& params);
    SqlRow read_row(sqlite3_stmt* stmt);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::recursive_mutex mutex_;   // transaction() re-enters execute()
};

} // namespace arena_tracker
