// ============= main.cpp - personadb command line =============
/*
 * USAGE:
 *   personadb_cli [--config personadb.toml] <command> [args]
 *
 *   stats
 *   systems
 *   list [--search s] [--category c] [--kind k] [--sort name|name-desc|category|ratings|recent]
 *        [--limit n] [--offset n]
 *   get <entity-id>
 *   history <entity-id>
 *   import <file.jsonl>
 *   similar '<json array>' [k] [--kind k]
 *
 * import reads one JSON object per line (see bulk_import.hpp). A bad record
 * is reported and skipped without writing anything; already imported
 * externalIds are skipped. Exit code 3 when any record failed.
 */

#include "persona_store.hpp"
#include "bulk_import.hpp"
#include "cli_args.hpp"
#include "database/json_codec.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--config file.toml] <command> [args]\n"
              << "Commands:\n"
              << "  stats\n"
              << "  systems\n"
              << "  list [--search s] [--category c] [--kind k] [--sort order]"
                 " [--limit n] [--offset n]\n"
              << "  get <entity-id>\n"
              << "  history <entity-id>\n"
              << "  import <file.jsonl>\n"
              << "  similar '<json array>' [k] [--kind k]\n";
}

void print_json(const Json::Value& value) {
    std::cout << write_json(value, true) << std::endl;
}

Json::Value entity_json(const Entity& e) {
    Json::Value v = to_json(e);
    v["ratingCount"] = Json::Int64(e.rating_count);
    Json::Value typings(Json::arrayValue);
    for (const auto& t : e.typings) {
        Json::Value tv(Json::objectValue);
        tv["system"] = t.system;
        tv["type"] = t.type_code;
        tv["ratings"] = Json::Int64(t.rating_count);
        tv["meanConfidence"] = t.mean_confidence;
        typings.append(tv);
    }
    v["typings"] = typings;
    return v;
}

// ==================== COMMANDS ====================

int cmd_list(PersonaStore& store, const std::vector<std::string>& args) {
    EntityQuery query = parse_list_args(args);

    Json::Value out(Json::arrayValue);
    for (const auto& e : store.list_entities(query)) {
        out.append(entity_json(e));
    }
    print_json(out);
    return 0;
}

int cmd_history(PersonaStore& store, const std::string& id) {
    Json::Value out(Json::arrayValue);
    for (const auto& h : store.list_edit_history(id)) {
        out.append(to_json(h));
    }
    print_json(out);
    return 0;
}

int cmd_import(PersonaStore& store, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("Cannot open {}", path);
        return 1;
    }

    ImportSummary summary = import_jsonl(store, file);
    return summary.failed == 0 ? 0 : 3;
}

int cmd_similar(PersonaStore& store, const std::vector<std::string>& args) {
    SimilarArgs similar = parse_similar_args(args);

    Json::Value out(Json::arrayValue);
    for (const auto& match : store.vector_search(similar.query, similar.k, similar.kind)) {
        out.append(to_json(match));
    }
    print_json(out);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("personadb"));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::vector<std::string> args(argv + 1, argv + argc);

    std::string config_file = "personadb.toml";
    if (args.size() >= 2 && args[0] == "--config") {
        config_file = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    StoreConfig config = StoreConfig::load(config_file);
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    try {
        PersonaStore store(config);
        store.initialize();

        if (command == "stats") {
            Json::Value out = to_json(store.stats());
            out["backend"] = to_string(store.backend_kind());
            out["vectors"] = Json::UInt64(store.indexed_vector_count());
            print_json(out);
            return 0;
        }
        if (command == "systems") {
            Json::Value out(Json::arrayValue);
            for (const auto& system : store.list_typing_systems()) {
                out.append(to_json(system));
            }
            print_json(out);
            return 0;
        }
        if (command == "list") {
            return cmd_list(store, rest);
        }
        if (command == "get" && !rest.empty()) {
            print_json(entity_json(store.get_entity(rest[0])));
            return 0;
        }
        if (command == "history" && !rest.empty()) {
            return cmd_history(store, rest[0]);
        }
        if (command == "import" && !rest.empty()) {
            return cmd_import(store, rest[0]);
        }
        if (command == "similar") {
            return cmd_similar(store, rest);
        }

        print_usage(argv[0]);
        return 1;
    } catch (const PersistenceError& e) {
        spdlog::error("{}", e.what());
        return 2;
    }
}
