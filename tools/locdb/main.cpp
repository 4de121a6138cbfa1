#include "rstools/locindex.h"
#include "rstools/mapsquare.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <vector>

#include "../common/tool_config.h"

namespace fs = std::filesystem;
using namespace rstools;
using cli::json;

static void stderr_progress(const locindex::BuildProgress& p) {
    if (p.phase == "configs") {
        std::cerr << "Decoding location configs...\n";
    } else if (p.phase == "squares") {
        // Redraw every 64 squares; a full grid is tens of thousands.
        if (p.square_index % 64 != 0 && p.square_index + 1 != p.square_total) return;
        int width = static_cast<int>(std::to_string(p.square_total).size());
        std::cerr << std::format("\r[{:>{}}/{:d}] square ({}, {})\033[K",
                                 p.square_index + 1, width, p.square_total, p.i, p.j);
    } else if (p.phase == "commit") {
        std::cerr << "\nCommitting...\n";
    }
}

static int do_build(const cli::Config& cfg, bool sound_retain) {
    if (cfg.db.empty()) {
        std::cerr << "Error: no output path. Specify output.db as argument, use -db, or set db in config.\n";
        return 1;
    }

    try {
        auto source = cli::open_cache(cfg);
        locindex::BuildOptions opts;
        opts.extent = cfg.extent;
        opts.config.sound_retain = sound_retain;
        opts.cache_dir = cfg.cache;

        auto result = locindex::DB::build_db(cfg.db, *source, opts, stderr_progress);
        std::cerr << std::format("Indexed {} locations, {} placements in {} squares ({} empty, {} malformed)\n",
                                 result.location_count, result.placement_count, result.squares_ok,
                                 result.squares_absent, result.squares_malformed);
    } catch (const std::exception& e) {
        std::cerr << "\nError: building database: " << e.what() << '\n';
        return 1;
    }

    std::error_code ec;
    auto size = fs::file_size(cfg.db, ec);
    if (!ec) {
        std::cerr << std::format("Wrote {} ({:.1f} MB)\n", cfg.db, static_cast<double>(size) / 1024 / 1024);
    }
    return 0;
}

static int do_find(const std::string& db_path, uint32_t loc_id, bool pretty) {
    auto db = locindex::DB::open(db_path);
    auto loc = db.location(loc_id);
    auto placements = db.find_placements(loc_id);

    json arr = json::array();
    for (const auto& p : placements) {
        auto e = cli::placement_json(p.square, p.location);
        e["name"] = loc && !loc->name.empty() ? json(loc->name) : json(nullptr);
        arr.push_back(std::move(e));
    }
    cli::write_json(std::cout, arr, pretty);
    std::cerr << "Found " << placements.size() << " placements\n";
    return 0;
}

static int do_name(const std::string& db_path, const std::string& pattern, bool pretty) {
    auto db = locindex::DB::open(db_path);
    auto rows = db.find_locations(pattern);

    json arr = json::array();
    for (const auto& r : rows) {
        arr.push_back({
            {"id", r.id},
            {"name", r.name},
            {"models", r.models},
            {"placements", db.find_placements(r.id).size()},
        });
    }
    cli::write_json(std::cout, arr, pretty);
    std::cerr << "Found " << rows.size() << " locations\n";
    return 0;
}

static int do_stats(const std::string& db_path) {
    auto db = locindex::DB::open(db_path);
    auto stats = db.stats();

    std::error_code ec;
    auto size = fs::file_size(db_path, ec);

    std::cout << "Database:       " << db_path << '\n';
    if (!ec) {
        std::cout << std::format("Size:           {:.1f} MB\n", static_cast<double>(size) / 1024 / 1024);
    }
    std::cout << "Schema version: " << stats.schema_version << '\n';
    std::cout << "Created:        " << stats.created_at << '\n';
    if (!stats.cache_dir.empty()) std::cout << "Cache:          " << stats.cache_dir << '\n';
    std::cout << "Locations:      " << stats.location_count << '\n';
    std::cout << "Placements:     " << stats.placement_count << '\n';
    std::cout << std::format("Squares:        {} decoded, {} empty, {} malformed\n",
                             stats.squares_ok, stats.squares_absent, stats.squares_malformed);
    return 0;
}

static void print_usage() {
    std::cerr << "Usage: locdb [flags] [output.db]\n\n"
              << "Location index database.\n\n"
              << "Modes:\n"
              << "  Build  (default)  Decode configs and map squares, write SQLite database\n"
              << "  Find   (-find)    Placements of a location id\n"
              << "  Name   (-name)    Locations whose name matches a LIKE pattern\n"
              << "  Stats  (-stats)   Show database statistics\n\n"
              << "Flags:\n"
              << "  -config <path>    Config file (JSON)\n"
              << "  -cache <dir>      Cache directory (main_file_cache.dat2)\n"
              << "  -keys <path>      XTEA keys (JSON)\n"
              << "  -db <path>        Database file path\n"
              << "  -width <n>        Grid width in squares (default 100)\n"
              << "  -height <n>       Grid height in squares (default 200)\n"
              << "  -sound-retain     Ambient sound opcodes carry a retain byte\n"
              << "  -find <id>        Find placements of a location\n"
              << "  -name <pattern>   Find locations by name (e.g. %door%)\n"
              << "  -stats            Show database statistics\n"
              << "  --pretty          Pretty-print JSON output\n";
}

int main(int argc, char* argv[]) {
    cli::Config cfg;
    bool sound_retain = false;
    std::string find_id;
    std::string name_pattern;
    bool stats_flag = false;
    bool pretty = false;
    std::vector<std::string> positional;

    try {
        if (auto path = cli::find_config_flag(argc, argv); !path.empty()) cfg = cli::load_config(path);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-config") == 0 && i + 1 < argc) ++i;
        else if (std::strcmp(arg, "-sound-retain") == 0) sound_retain = true;
        else if (std::strcmp(arg, "-find") == 0 && i + 1 < argc) find_id = argv[++i];
        else if (std::strcmp(arg, "-name") == 0 && i + 1 < argc) name_pattern = argv[++i];
        else if (std::strcmp(arg, "-stats") == 0) stats_flag = true;
        else if (std::strcmp(arg, "--pretty") == 0) pretty = true;
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage();
            return 0;
        } else if (!cli::parse_common_flag(cfg, argc, argv, i)) {
            positional.push_back(arg);
        }
    }

    if (cfg.db.empty() && !positional.empty()) cfg.db = positional[0];

    bool query = !find_id.empty() || !name_pattern.empty() || stats_flag;
    if (!query) return do_build(cfg, sound_retain);

    if (cfg.db.empty()) {
        std::cerr << "Error: -db is required for queries.\n";
        return 1;
    }

    try {
        if (!find_id.empty()) return do_find(cfg.db, static_cast<uint32_t>(std::stoul(find_id)), pretty);
        if (!name_pattern.empty()) return do_name(cfg.db, name_pattern, pretty);
        return do_stats(cfg.db);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
