#pragma once

#include "rstools/cache.h"
#include "rstools/mapsquare.h"

#include <nlohmann/json.hpp>

#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <stdexcept>
#include <string>

namespace rstools::cli {

using json = nlohmann::ordered_json;

// Config holds settings shared by all tools. Values come from a -config JSON
// file and are overridden by command-line flags.
struct Config {
    std::string cache; // directory with main_file_cache.dat2
    std::string keys;  // XTEA keys JSON
    std::string db;
    mapsquare::GridExtent extent;
    unsigned threads = 1;
};

inline Config load_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("reading config " + path);
    json j = json::parse(f);
    Config cfg;
    if (j.contains("cache")) cfg.cache = j["cache"].get<std::string>();
    if (j.contains("keys")) cfg.keys = j["keys"].get<std::string>();
    if (j.contains("db")) cfg.db = j["db"].get<std::string>();
    if (j.contains("gridWidth")) cfg.extent.width = j["gridWidth"].get<uint32_t>();
    if (j.contains("gridHeight")) cfg.extent.height = j["gridHeight"].get<uint32_t>();
    if (j.contains("threads")) cfg.threads = j["threads"].get<unsigned>();
    return cfg;
}

// find_config_flag returns the -config argument, or "" when absent. The
// config is loaded before other flags so that they override it.
inline std::string find_config_flag(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; i++) {
        if (std::strcmp(argv[i], "-config") == 0) return argv[i + 1];
    }
    return "";
}

// parse_common_flag consumes flags every tool accepts. Returns true when
// argv[i] was one of them.
inline bool parse_common_flag(Config& cfg, int argc, char* argv[], int& i) {
    if (std::strcmp(argv[i], "-cache") == 0 && i + 1 < argc) cfg.cache = argv[++i];
    else if (std::strcmp(argv[i], "-keys") == 0 && i + 1 < argc) cfg.keys = argv[++i];
    else if (std::strcmp(argv[i], "-db") == 0 && i + 1 < argc) cfg.db = argv[++i];
    else if (std::strcmp(argv[i], "-width") == 0 && i + 1 < argc)
        cfg.extent.width = static_cast<uint32_t>(std::stoul(argv[++i]));
    else if (std::strcmp(argv[i], "-height") == 0 && i + 1 < argc)
        cfg.extent.height = static_cast<uint32_t>(std::stoul(argv[++i]));
    else if (std::strcmp(argv[i], "-j") == 0 && i + 1 < argc)
        cfg.threads = static_cast<unsigned>(std::stoul(argv[++i]));
    else return false;
    return true;
}

inline std::unique_ptr<cache::Dat2Source> open_cache(const Config& cfg) {
    if (cfg.cache.empty())
        throw std::runtime_error("no cache directory (use -cache or set cache in config)");
    cache::Keyring keys;
    if (!cfg.keys.empty()) keys = cache::load_xtea_keys(cfg.keys);
    return std::make_unique<cache::Dat2Source>(cfg.cache, std::move(keys));
}

inline json placement_json(const mapsquare::Coord& square, const mapsquare::PlacedLocation& loc) {
    auto world = mapsquare::world_tile(square, loc);
    return {
        {"id", loc.id},
        {"square", {{"i", square.i}, {"j", square.j}}},
        {"local", {{"x", loc.x}, {"y", loc.y}}},
        {"world", {{"x", world.x}, {"y", world.y}}},
        {"plane", loc.plane},
        {"type", mapsquare::location_type_name(loc.type)},
        {"orientation", mapsquare::orientation_name(loc.orientation)},
    };
}

inline void write_json(std::ostream& out, const json& doc, bool pretty) {
    if (pretty) out << std::setw(2) << doc << '\n';
    else out << doc << '\n';
}

inline void write_json_file(const std::string& path, const json& doc, bool pretty) {
    std::ofstream f(path);
    if (!f) throw std::runtime_error("creating " + path);
    write_json(f, doc, pretty);
}

} // namespace rstools::cli
