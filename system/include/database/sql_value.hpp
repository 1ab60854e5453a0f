// ============= include/database/sql_value.hpp =============
/*
 * Backend-neutral SQL values
 *
 * SqlStatement carries the text plus positional parameters (?), so the
 * same statement can be bound by the SQLite and DuckDB connections.
 * Embeddings travel as raw float BLOBs (native endianness).
 */

#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using Blob = std::vector<unsigned char>;
using SqlValue = std::variant<std::monostate, int64_t, double, std::string, Blob>;
using SqlRow = std::vector<SqlValue>;

struct SqlStatement {
    std::string text;
    std::vector<SqlValue> params;
};

enum class SqlDialect {
    Sqlite,
    DuckDb
};

// NULL reads as "" / 0 / 0.0 / empty blob
std::string text_at(const SqlRow& row, size_t col);
int64_t int_at(const SqlRow& row, size_t col);
double double_at(const SqlRow& row, size_t col);
Blob blob_at(const SqlRow& row, size_t col);

Blob serialize_embedding(const std::vector<float>& emb);
std::vector<float> deserialize_embedding(const Blob& blob);
