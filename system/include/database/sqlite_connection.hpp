// ============= include/database/sqlite_connection.hpp =============
/*
 * Single SQLite connection (WAL, synchronous=NORMAL)
 *
 * Every failure is raised as BackendError carrying sqlite3_errmsg().
 * Not internally synchronized; SqlRecordStore serializes access.
 */

#pragma once
#include "database/sql_value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

class SqliteConnection {
public:
    static constexpr SqlDialect dialect = SqlDialect::Sqlite;
    static const char* backend_name() { return "sqlite"; }

    // ":memory:" opens a private in-memory database
    explicit SqliteConnection(const std::string& db_path);
    ~SqliteConnection();

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    void execute_script(const std::string& sql);

    // Returns the number of rows changed
    int64_t execute(const SqlStatement& stmt);
    std::vector<SqlRow> query(const SqlStatement& stmt);

    void begin();
    void commit();
    void rollback();

    const std::string& path() const { return db_path; }

private:
    sqlite3* db;
    std::string db_path;

    sqlite3_stmt* prepare(const SqlStatement& stmt);
};
