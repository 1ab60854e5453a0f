// ============= src/database/duckdb_connection.cpp =============
#include "database/duckdb_connection.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

DuckDbConnection::DuckDbConnection(const std::string& db_path)
    : database(nullptr), connection(nullptr), db_path(db_path)
{
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            throw BackendError("duckdb open", "cannot create directory " +
                               p.parent_path().string() + ": " + ec.message());
        }
    }

    char* open_error = nullptr;
    if (duckdb_open_ext(db_path.c_str(), &database, nullptr, &open_error) == DuckDBError) {
        std::string msg = open_error ? open_error : "unknown error";
        duckdb_free(open_error);
        throw BackendError("duckdb open", db_path + ": " + msg);
    }

    if (duckdb_connect(database, &connection) == DuckDBError) {
        duckdb_close(&database);
        throw BackendError("duckdb connect", db_path);
    }

    spdlog::debug("DuckDB opened: {}", db_path);
}

DuckDbConnection::~DuckDbConnection() {
    if (connection) {
        duckdb_disconnect(&connection);
    }
    if (database) {
        duckdb_close(&database);
    }
}

void DuckDbConnection::execute_script(const std::string& sql) {
    duckdb_result result;
    if (duckdb_query(connection, sql.c_str(), &result) == DuckDBError) {
        std::string msg = duckdb_result_error(&result) ? duckdb_result_error(&result) : "";
        duckdb_destroy_result(&result);
        throw BackendError("duckdb exec", msg);
    }
    duckdb_destroy_result(&result);
}

void DuckDbConnection::run(const SqlStatement& stmt, duckdb_result* result,
                           const char* operation) {
    duckdb_prepared_statement prepared;
    if (duckdb_prepare(connection, stmt.text.c_str(), &prepared) == DuckDBError) {
        std::string msg = duckdb_prepare_error(prepared) ? duckdb_prepare_error(prepared) : "";
        duckdb_destroy_prepare(&prepared);
        throw BackendError(operation, "prepare: " + msg);
    }

    for (size_t i = 0; i < stmt.params.size(); ++i) {
        idx_t idx = static_cast<idx_t>(i + 1);
        const SqlValue& v = stmt.params[i];
        duckdb_state state;

        if (auto s = std::get_if<std::string>(&v)) {
            state = duckdb_bind_varchar_length(prepared, idx, s->data(), s->size());
        } else if (auto n = std::get_if<int64_t>(&v)) {
            state = duckdb_bind_int64(prepared, idx, *n);
        } else if (auto d = std::get_if<double>(&v)) {
            state = duckdb_bind_double(prepared, idx, *d);
        } else if (auto b = std::get_if<Blob>(&v)) {
            state = duckdb_bind_blob(prepared, idx, b->data(), b->size());
        } else {
            state = duckdb_bind_null(prepared, idx);
        }

        if (state == DuckDBError) {
            duckdb_destroy_prepare(&prepared);
            throw BackendError(operation, "bind parameter " + std::to_string(idx));
        }
    }

    if (duckdb_execute_prepared(prepared, result) == DuckDBError) {
        std::string msg = duckdb_result_error(result) ? duckdb_result_error(result) : "";
        duckdb_destroy_result(result);
        duckdb_destroy_prepare(&prepared);
        throw BackendError(operation, msg);
    }

    duckdb_destroy_prepare(&prepared);
}

int64_t DuckDbConnection::execute(const SqlStatement& stmt) {
    duckdb_result result;
    run(stmt, &result, "duckdb execute");

    int64_t changed = static_cast<int64_t>(duckdb_rows_changed(&result));
    duckdb_destroy_result(&result);
    return changed;
}

std::vector<SqlRow> DuckDbConnection::query(const SqlStatement& stmt) {
    duckdb_result result;
    run(stmt, &result, "duckdb query");

    idx_t cols = duckdb_column_count(&result);
    idx_t count = duckdb_row_count(&result);

    std::vector<SqlRow> rows;
    rows.reserve(count);

    for (idx_t r = 0; r < count; ++r) {
        SqlRow row;
        row.reserve(cols);

        for (idx_t c = 0; c < cols; ++c) {
            if (duckdb_value_is_null(&result, c, r)) {
                row.emplace_back(std::monostate{});
                continue;
            }

            switch (duckdb_column_type(&result, c)) {
                case DUCKDB_TYPE_BOOLEAN:
                case DUCKDB_TYPE_TINYINT:
                case DUCKDB_TYPE_SMALLINT:
                case DUCKDB_TYPE_INTEGER:
                case DUCKDB_TYPE_BIGINT:
                case DUCKDB_TYPE_UTINYINT:
                case DUCKDB_TYPE_USMALLINT:
                case DUCKDB_TYPE_UINTEGER:
                case DUCKDB_TYPE_UBIGINT:
                case DUCKDB_TYPE_HUGEINT:
                    row.emplace_back(static_cast<int64_t>(duckdb_value_int64(&result, c, r)));
                    break;
                case DUCKDB_TYPE_FLOAT:
                case DUCKDB_TYPE_DOUBLE:
                case DUCKDB_TYPE_DECIMAL:
                    row.emplace_back(duckdb_value_double(&result, c, r));
                    break;
                case DUCKDB_TYPE_BLOB: {
                    duckdb_blob blob = duckdb_value_blob(&result, c, r);
                    const unsigned char* data = static_cast<const unsigned char*>(blob.data);
                    row.emplace_back(Blob(data, data + blob.size));
                    duckdb_free(blob.data);
                    break;
                }
                default: {
                    char* text = duckdb_value_varchar(&result, c, r);
                    row.emplace_back(std::string(text ? text : ""));
                    duckdb_free(text);
                    break;
                }
            }
        }

        rows.push_back(std::move(row));
    }

    duckdb_destroy_result(&result);
    return rows;
}

void DuckDbConnection::begin() {
    execute_script("BEGIN TRANSACTION");
}

void DuckDbConnection::commit() {
    execute_script("COMMIT");
}

void DuckDbConnection::rollback() {
    execute_script("ROLLBACK");
}
