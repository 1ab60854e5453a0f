// ============= include/database/duckdb_connection.hpp =============
/*
 * Single DuckDB connection over the C API
 *
 * Only compiled when CMake finds libduckdb (PERSONADB_HAVE_DUCKDB=1).
 * Same contract as SqliteConnection so SqlRecordStore can be
 * instantiated over either.
 */

#pragma once
#include "database/sql_value.hpp"
#include <duckdb.h>
#include <string>
#include <vector>

class DuckDbConnection {
public:
    static constexpr SqlDialect dialect = SqlDialect::DuckDb;
    static const char* backend_name() { return "duckdb"; }

    explicit DuckDbConnection(const std::string& db_path);
    ~DuckDbConnection();

    DuckDbConnection(const DuckDbConnection&) = delete;
    DuckDbConnection& operator=(const DuckDbConnection&) = delete;

    void execute_script(const std::string& sql);
    int64_t execute(const SqlStatement& stmt);
    std::vector<SqlRow> query(const SqlStatement& stmt);

    void begin();
    void commit();
    void rollback();

    const std::string& path() const { return db_path; }

private:
    duckdb_database database;
    duckdb_connection connection;
    std::string db_path;

    // Prepares, binds and executes; caller destroys the result
    void run(const SqlStatement& stmt, duckdb_result* result, const char* operation);
};
