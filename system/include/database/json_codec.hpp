// ============= include/database/json_codec.hpp =============
/*
 * jsoncpp <-> record types
 *
 * Used by the fallback snapshot, the metadata column and the CLI.
 * Keys are camelCase ("externalId", "createdAt", "typingSystems").
 * Decoding raises ValidationError on a wrongly typed field; missing
 * fields keep their defaults.
 */

#pragma once
#include "core/types.hpp"
#include <json/json.h>
#include <string>

std::string write_json(const Json::Value& value, bool pretty = false);

// false + message in *errors on malformed input
bool parse_json(const std::string& text, Json::Value& out, std::string* errors = nullptr);

Json::Value to_json(const Entity& entity);
Json::Value to_json(const User& user);
Json::Value to_json(const Rating& rating);
Json::Value to_json(const Comment& comment);
Json::Value to_json(const EditHistoryRecord& record);
Json::Value to_json(const TypingSystem& system);
Json::Value to_json(const EmbeddingRecord& embedding);
Json::Value to_json(const StoreStats& stats);
Json::Value to_json(const VectorMatch& match);

Entity entity_from_json(const Json::Value& v);
EntityDraft entity_draft_from_json(const Json::Value& v);
User user_from_json(const Json::Value& v);
Rating rating_from_json(const Json::Value& v);
Comment comment_from_json(const Json::Value& v);
EditHistoryRecord edit_history_from_json(const Json::Value& v);
TypingSystem typing_system_from_json(const Json::Value& v);
EmbeddingRecord embedding_from_json(const Json::Value& v);
std::vector<float> vector_from_json(const Json::Value& v);
