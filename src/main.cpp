#include "config.hpp"
#include "util.hpp"
#include "cache/query_cache.hpp"
#include "cache/question_key.hpp"
#include "cache/report_json.hpp"
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

static void print_usage() {
    std::cout << "Usage: querycache [options] COMMAND [ARG]\n"
              << "\n"
              << "Options:\n"
              << "  --config FILE        Load config from FILE instead of ~/.querycache/config.json\n"
              << "  --db PATH            Use cache database at PATH\n"
              << "  --model NAME         Model name used for cache keys\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  stats                Show all-time and today's cache statistics\n"
              << "  clear                Delete every cache entry\n"
              << "  clear-expired        Delete entries past their TTL\n"
              << "  maintain             Invalidate cached failures, drop expired and invalid rows\n"
              << "  get QUESTION         Look up a cached answer\n"
              << "  check FILE           Report which questions (one per line) are cached\n"
              << "  key QUESTION         Print the cache key for QUESTION and the model\n"
              << "  normalize QUESTION   Print the normalized form of QUESTION\n"
              << "\n"
              << "Environment variables:\n"
              << "  CACHE_ENABLED             true/false\n"
              << "  CACHE_DB_PATH             Cache database path\n"
              << "  CACHE_TTL_SECONDS         Default entry TTL (default: 86400)\n"
              << "  CACHE_MAX_SIZE_MB         Aggregate size cap (default: 500)\n"
              << "  CACHE_MAX_RESULT_SIZE_MB  Per-entry size cap (default: 10)\n";
}

static int run_check(querycache::QueryCache& cache, const std::string& path,
                     const std::string& model) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Error: cannot open " << path << "\n";
        return 1;
    }

    nlohmann::json out = nlohmann::json::array();
    std::string line;
    while (std::getline(file, line)) {
        std::string question = querycache::trim(line);
        if (question.empty() || question[0] == '#') continue;
        out.push_back({{"question", question}, {"cached", cache.contains(question, model)}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string db_override;
    std::string model_override;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if ((arg == "--config" || arg == "--db" || arg == "--model") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--db") db_override = value;
            else model_override = value;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    querycache::Config config = config_path.empty()
        ? querycache::Config::load()
        : querycache::Config::load_file(config_path);
    if (!db_override.empty()) config.cache.path = db_override;
    if (!model_override.empty()) config.model = model_override;

    const std::string& command = positional[0];
    std::string arg = positional.size() > 1 ? positional[1] : "";

    // Pure commands need no database.
    if (command == "normalize" || command == "key") {
        if (arg.empty()) {
            std::cerr << "Error: " << command << " requires a QUESTION\n";
            return 1;
        }
        if (command == "normalize") {
            std::cout << querycache::normalize_question(arg) << "\n";
        } else {
            std::cout << querycache::cache_key(arg, config.model) << "\n";
        }
        return 0;
    }

    auto cache = querycache::open_query_cache(config.cache);
    if (!cache) {
        std::cerr << "Error: cache unavailable\n";
        return 1;
    }

    if (command == "stats") {
        std::cout << querycache::report_to_json(cache->get_statistics()).dump(2) << "\n";
    } else if (command == "clear") {
        std::cout << nlohmann::json{{"removed", cache->clear_all()}}.dump(2) << "\n";
    } else if (command == "clear-expired") {
        std::cout << nlohmann::json{{"removed", cache->clear_expired()}}.dump(2) << "\n";
    } else if (command == "maintain") {
        std::cout << querycache::maintenance_to_json(cache->maintain()).dump(2) << "\n";
    } else if (command == "get") {
        if (arg.empty()) {
            std::cerr << "Error: get requires a QUESTION\n";
            return 1;
        }
        std::cout << querycache::lookup_to_json(cache->get(arg, config.model)).dump(2) << "\n";
    } else if (command == "check") {
        if (arg.empty()) {
            std::cerr << "Error: check requires a FILE\n";
            return 1;
        }
        return run_check(*cache, arg, config.model);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }

    return 0;
}
