// ============= src/database/sqlite_connection.cpp =============
#include "database/sqlite_connection.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>

SqliteConnection::SqliteConnection(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
            if (ec) {
                throw BackendError("sqlite open", "cannot create directory " +
                                   p.parent_path().string() + ": " + ec.message());
            }
        }
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
        sqlite3_close(db);
        db = nullptr;
        throw BackendError("sqlite open", db_path + ": " + msg);
    }

    sqlite3_busy_timeout(db, 5000);

    try {
        // WAL is refused for :memory:, which silently keeps "memory" mode
        execute_script("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
    } catch (const BackendError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    spdlog::debug("SQLite opened: {}", db_path);
}

SqliteConnection::~SqliteConnection() {
    if (db) {
        sqlite3_close(db);
    }
}

void SqliteConnection::execute_script(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        throw BackendError("sqlite exec", msg);
    }
}

sqlite3_stmt* SqliteConnection::prepare(const SqlStatement& stmt) {
    sqlite3_stmt* handle = nullptr;

    int rc = sqlite3_prepare_v2(db, stmt.text.c_str(), -1, &handle, nullptr);
    if (rc != SQLITE_OK) {
        throw BackendError("sqlite prepare", sqlite3_errmsg(db));
    }

    for (size_t i = 0; i < stmt.params.size(); ++i) {
        int idx = static_cast<int>(i + 1);
        const SqlValue& v = stmt.params[i];

        if (auto s = std::get_if<std::string>(&v)) {
            rc = sqlite3_bind_text(handle, idx, s->c_str(), static_cast<int>(s->size()),
                                   SQLITE_TRANSIENT);
        } else if (auto n = std::get_if<int64_t>(&v)) {
            rc = sqlite3_bind_int64(handle, idx, *n);
        } else if (auto d = std::get_if<double>(&v)) {
            rc = sqlite3_bind_double(handle, idx, *d);
        } else if (auto b = std::get_if<Blob>(&v)) {
            rc = sqlite3_bind_blob(handle, idx, b->data(), static_cast<int>(b->size()),
                                   SQLITE_TRANSIENT);
        } else {
            rc = sqlite3_bind_null(handle, idx);
        }

        if (rc != SQLITE_OK) {
            std::string msg = sqlite3_errmsg(db);
            sqlite3_finalize(handle);
            throw BackendError("sqlite bind", msg);
        }
    }

    return handle;
}

int64_t SqliteConnection::execute(const SqlStatement& stmt) {
    sqlite3_stmt* handle = prepare(stmt);

    int rc = sqlite3_step(handle);
    sqlite3_finalize(handle);

    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        throw BackendError("sqlite step", sqlite3_errmsg(db));
    }

    return sqlite3_changes(db);
}

std::vector<SqlRow> SqliteConnection::query(const SqlStatement& stmt) {
    sqlite3_stmt* handle = prepare(stmt);
    std::vector<SqlRow> rows;

    int rc;
    while ((rc = sqlite3_step(handle)) == SQLITE_ROW) {
        int cols = sqlite3_column_count(handle);
        SqlRow row;
        row.reserve(cols);

        for (int c = 0; c < cols; ++c) {
            switch (sqlite3_column_type(handle, c)) {
                case SQLITE_INTEGER:
                    row.emplace_back(static_cast<int64_t>(sqlite3_column_int64(handle, c)));
                    break;
                case SQLITE_FLOAT:
                    row.emplace_back(sqlite3_column_double(handle, c));
                    break;
                case SQLITE_TEXT: {
                    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(handle, c));
                    int size = sqlite3_column_bytes(handle, c);
                    row.emplace_back(std::string(text, size));
                    break;
                }
                case SQLITE_BLOB: {
                    const unsigned char* data =
                        static_cast<const unsigned char*>(sqlite3_column_blob(handle, c));
                    int size = sqlite3_column_bytes(handle, c);
                    row.emplace_back(Blob(data, data + size));
                    break;
                }
                default:
                    row.emplace_back(std::monostate{});
                    break;
            }
        }

        rows.push_back(std::move(row));
    }

    sqlite3_finalize(handle);

    if (rc != SQLITE_DONE) {
        throw BackendError("sqlite query", sqlite3_errmsg(db));
    }

    return rows;
}

void SqliteConnection::begin() {
    execute_script("BEGIN IMMEDIATE");
}

void SqliteConnection::commit() {
    execute_script("COMMIT");
}

void SqliteConnection::rollback() {
    execute_script("ROLLBACK");
}
