// ============= include/bulk_import.hpp =============
/*
 * JSON-lines bulk import
 *
 * One object per line:
 *   {"externalId": "...", "externalSource": "...", "entity": {...},
 *    "typings": [{"system", "type", "confidence", "rationale"}],
 *    "embedding": [...]}
 *
 * - A record is checked in full before anything is written: entity fields,
 *   every typing (catalog + confidence), embedding dimension and capacity
 * - A record whose (externalSource, externalId) is already stored is
 *   skipped, so re-running an import does not duplicate entities
 * - A failing record never affects records committed before it
 */

#pragma once
#include "persona_store.hpp"
#include <json/json.h>
#include <istream>
#include <optional>
#include <string>
#include <vector>

struct ImportTyping {
    std::string system;
    std::string type_code;
    double confidence = 1.0;
    std::string rationale;
};

struct ImportRecord {
    EntityDraft entity;
    std::vector<ImportTyping> typings;
    std::optional<std::vector<float>> embedding;
};

enum class ImportOutcome {
    Imported,
    Skipped
};

struct ImportSummary {
    size_t imported = 0;
    size_t skipped = 0;
    size_t failed = 0;
};

// Rater id recorded on imported ratings
extern const char* const IMPORT_RATER;

// Throws ValidationError on a malformed record
ImportRecord import_record_from_json(const Json::Value& record);

ImportOutcome import_record(PersonaStore& store, const ImportRecord& record);

// Reads to the end of the stream; bad lines are logged and counted
ImportSummary import_jsonl(PersonaStore& store, std::istream& in);
