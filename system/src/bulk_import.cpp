// ============= src/bulk_import.cpp =============
#include "bulk_import.hpp"
#include "database/json_codec.hpp"
#include "database/validation.hpp"
#include "core/errors.hpp"
#include "core/ids.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>

const char* const IMPORT_RATER = "import";

namespace {

std::string string_field(const Json::Value& v, const char* key) {
    const Json::Value& field = v[key];
    if (field.isNull()) return "";
    if (!field.isString()) {
        throw ValidationError(std::string("import field '") + key + "' must be a string");
    }
    return field.asString();
}

// Every (system, type_code) must be in the catalog and every confidence in [0, 1]
std::vector<Rating> prepare_ratings(PersonaStore& store, const std::string& entity_id,
                                    const std::vector<ImportTyping>& typings) {
    std::map<std::string, std::vector<std::string>> catalog;
    if (!typings.empty()) {
        for (auto& system : store.list_typing_systems()) {
            catalog[system.name] = std::move(system.type_codes);
        }
    }

    std::vector<Rating> ratings;
    for (const auto& typing : typings) {
        Rating rating;
        rating.entity_id = entity_id;
        rating.rater_id = IMPORT_RATER;
        rating.system = typing.system;
        rating.type_code = typing.type_code;
        rating.confidence = typing.confidence;
        rating.rationale = typing.rationale;
        validate_rating(rating);

        auto codes = catalog.find(typing.system);
        if (codes == catalog.end() ||
            std::find(codes->second.begin(), codes->second.end(), typing.type_code) ==
                codes->second.end()) {
            throw ValidationError("unknown type code '" + typing.type_code +
                                  "' for typing system '" + typing.system + "'");
        }
        ratings.push_back(std::move(rating));
    }
    return ratings;
}

}  // namespace

// ==================== DECODE ====================

ImportRecord import_record_from_json(const Json::Value& record) {
    if (!record.isObject()) {
        throw ValidationError("record must be a JSON object");
    }

    ImportRecord out;
    out.entity = entity_draft_from_json(record["entity"]);
    if (out.entity.external_id.empty()) {
        out.entity.external_id = string_field(record, "externalId");
    }
    if (out.entity.external_source.empty()) {
        out.entity.external_source = string_field(record, "externalSource");
    }

    const Json::Value& typings = record["typings"];
    if (!typings.isNull() && !typings.isArray()) {
        throw ValidationError("import field 'typings' must be an array");
    }
    for (const auto& t : typings) {
        if (!t.isObject()) {
            throw ValidationError("each typing must be a JSON object");
        }
        ImportTyping typing;
        typing.system = string_field(t, "system");
        typing.type_code = string_field(t, "type");
        typing.rationale = string_field(t, "rationale");
        if (!t["confidence"].isNull()) {
            if (!t["confidence"].isNumeric()) {
                throw ValidationError("typing confidence must be a number");
            }
            typing.confidence = t["confidence"].asDouble();
        }
        out.typings.push_back(std::move(typing));
    }

    if (record.isMember("embedding")) {
        out.embedding = vector_from_json(record["embedding"]);
    }
    return out;
}

// ==================== IMPORT ====================

ImportOutcome import_record(PersonaStore& store, const ImportRecord& record) {
    EntityDraft draft = record.entity;
    validate_entity_draft(draft);

    if (!draft.external_id.empty()) {
        auto existing = store.find_entity_by_external_id(draft.external_source, draft.external_id);
        if (existing) {
            spdlog::debug("Skipping {}: already imported as {}", draft.external_id, existing->id);
            return ImportOutcome::Skipped;
        }
    }

    if (draft.id.empty()) {
        draft.id = generate_id();
    }

    auto ratings = prepare_ratings(store, draft.id, record.typings);
    if (record.embedding) {
        store.check_new_embedding(*record.embedding);
    }

    Entity entity = store.create_entity(draft);
    for (const auto& rating : ratings) {
        store.add_rating(rating);
    }
    if (record.embedding) {
        store.add_embedding(entity.id, *record.embedding);
    }
    return ImportOutcome::Imported;
}

ImportSummary import_jsonl(PersonaStore& store, std::istream& in) {
    ImportSummary summary;
    size_t line_no = 0;
    std::string line;

    while (std::getline(in, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        Json::Value json;
        std::string errors;
        if (!parse_json(line, json, &errors)) {
            spdlog::warn("line {}: invalid JSON: {}", line_no, errors);
            summary.failed++;
            continue;
        }

        try {
            if (import_record(store, import_record_from_json(json)) == ImportOutcome::Skipped) {
                summary.skipped++;
            } else {
                summary.imported++;
            }
        } catch (const PersistenceError& e) {
            spdlog::warn("line {}: {}", line_no, e.what());
            summary.failed++;
        }
    }

    spdlog::info("✓ Import finished: {} imported, {} skipped, {} failed",
                 summary.imported, summary.skipped, summary.failed);
    return summary;
}
