// ============= include/cli_args.hpp =============
/*
 * Argument parsing for personadb_cli
 *
 * Every parser raises ValidationError on bad input, so main() reports
 * it like any other store error.
 */

#pragma once
#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Whole string must be a base-10 integer
int64_t parse_int(const std::string& text, const char* what);

// parse_int() restricted to [min_value, max_value]
int64_t parse_int_in_range(const std::string& text, const char* what,
                           int64_t min_value, int64_t max_value);

// list [--search s] [--category c] [--kind k] [--sort order] [--limit n] [--offset n]
EntityQuery parse_list_args(const std::vector<std::string>& args);

struct SimilarArgs {
    std::vector<float> query;
    int k = 10;
    std::optional<EntityKind> kind;
};

// similar '<json array>' [k] [--kind k]
SimilarArgs parse_similar_args(const std::vector<std::string>& args);
