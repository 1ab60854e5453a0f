// ============= src/cli_args.cpp =============
#include "cli_args.hpp"
#include "database/json_codec.hpp"
#include "core/errors.hpp"
#include <limits>
#include <stdexcept>

int64_t parse_int(const std::string& text, const char* what) {
    try {
        size_t used = 0;
        int64_t value = std::stoll(text, &used);
        if (used != text.size()) {
            throw ValidationError(std::string(what) + " must be an integer: " + text);
        }
        return value;
    } catch (const std::invalid_argument&) {
        throw ValidationError(std::string(what) + " must be an integer: " + text);
    } catch (const std::out_of_range&) {
        throw ValidationError(std::string(what) + " is out of range: " + text);
    }
}

int64_t parse_int_in_range(const std::string& text, const char* what,
                           int64_t min_value, int64_t max_value) {
    int64_t value = parse_int(text, what);
    if (value < min_value || value > max_value) {
        throw ValidationError(std::string(what) + " must be within [" +
                              std::to_string(min_value) + ", " + std::to_string(max_value) +
                              "], got " + text);
    }
    return value;
}

EntityQuery parse_list_args(const std::vector<std::string>& args) {
    EntityQuery query;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--search" && has_value) {
            query.search = args[++i];
        } else if (arg == "--category" && has_value) {
            query.category = args[++i];
        } else if (arg == "--kind" && has_value) {
            query.kind = parse_entity_kind(args[++i]);
        } else if (arg == "--sort" && has_value) {
            query.sort = parse_entity_sort(args[++i]);
        } else if (arg == "--limit" && has_value) {
            query.limit = parse_int_in_range(args[++i], "--limit", 0,
                                             std::numeric_limits<int64_t>::max());
        } else if (arg == "--offset" && has_value) {
            query.offset = parse_int_in_range(args[++i], "--offset", 0,
                                              std::numeric_limits<int64_t>::max());
        } else {
            throw ValidationError("unknown list option: " + arg);
        }
    }
    return query;
}

SimilarArgs parse_similar_args(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw ValidationError("similar needs a JSON array");
    }

    SimilarArgs out;

    Json::Value parsed;
    std::string errors;
    if (!parse_json(args[0], parsed, &errors)) {
        throw ValidationError("query vector is not valid JSON: " + errors);
    }
    out.query = vector_from_json(parsed);

    bool have_k = false;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--kind" && i + 1 < args.size()) {
            out.kind = parse_entity_kind(args[++i]);
        } else if (!have_k) {
            out.k = static_cast<int>(
                parse_int_in_range(args[i], "k", 0, std::numeric_limits<int>::max()));
            have_k = true;
        } else {
            throw ValidationError("unexpected similar argument: " + args[i]);
        }
    }
    return out;
}
