// ============= src/database/sql_value.cpp =============
#include "database/sql_value.hpp"
#include <cstring>

std::string text_at(const SqlRow& row, size_t col) {
    const SqlValue& v = row.at(col);
    if (auto s = std::get_if<std::string>(&v)) return *s;
    if (auto i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&v)) return std::to_string(*d);
    if (auto b = std::get_if<Blob>(&v)) return std::string(b->begin(), b->end());
    return "";
}

int64_t int_at(const SqlRow& row, size_t col) {
    const SqlValue& v = row.at(col);
    if (auto i = std::get_if<int64_t>(&v)) return *i;
    if (auto d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
    if (auto s = std::get_if<std::string>(&v)) return s->empty() ? 0 : std::stoll(*s);
    return 0;
}

double double_at(const SqlRow& row, size_t col) {
    const SqlValue& v = row.at(col);
    if (auto d = std::get_if<double>(&v)) return *d;
    if (auto i = std::get_if<int64_t>(&v)) return static_cast<double>(*i);
    if (auto s = std::get_if<std::string>(&v)) return s->empty() ? 0.0 : std::stod(*s);
    return 0.0;
}

Blob blob_at(const SqlRow& row, size_t col) {
    const SqlValue& v = row.at(col);
    if (auto b = std::get_if<Blob>(&v)) return *b;
    if (auto s = std::get_if<std::string>(&v)) return Blob(s->begin(), s->end());
    return {};
}

// ==================== SERIALIZATION ====================

Blob serialize_embedding(const std::vector<float>& emb) {
    Blob blob(emb.size() * sizeof(float));
    if (!blob.empty()) {
        std::memcpy(blob.data(), emb.data(), blob.size());
    }
    return blob;
}

std::vector<float> deserialize_embedding(const Blob& blob) {
    std::vector<float> emb(blob.size() / sizeof(float));
    if (!emb.empty()) {
        std::memcpy(emb.data(), blob.data(), emb.size() * sizeof(float));
    }
    return emb;
}
