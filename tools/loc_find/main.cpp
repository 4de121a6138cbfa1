#include "rstools/cache.h"
#include "rstools/locconfig.h"
#include "rstools/mapsquare.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <format>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/tool_config.h"

using namespace rstools;
using cli::json;

static std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static void print_usage() {
    std::cerr << "Usage: loc_find [flags] [location_id]\n\n"
              << "Finds every placement of a location in the world map.\n"
              << "Without an id or -name, searches for location 6560.\n\n"
              << "Flags:\n"
              << "  -config <path>   Config file (JSON)\n"
              << "  -cache <dir>     Cache directory (main_file_cache.dat2)\n"
              << "  -keys <path>     XTEA keys (JSON)\n"
              << "  -name <text>     Match locations whose name contains text\n"
              << "  -width <n>       Grid width in squares (default 100)\n"
              << "  -height <n>      Grid height in squares (default 200)\n"
              << "  -query-extent    Size the grid from the cache instead\n"
              << "  -j <n>           Decode with n threads\n"
              << "  --json           Write placements as JSON\n"
              << "  --pretty         Pretty-print JSON output\n"
              << "  -v, --verbose    Enable verbose logging\n"
              << "  -vv, --debug     Enable debug logging\n";
}

int main(int argc, char* argv[]) {
    cli::Config cfg;
    std::string name_filter;
    bool query_extent = false;
    bool json_out = false;
    bool pretty = false;
    int verbosity = 0;
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
        else if (std::strcmp(arg, "-name") == 0 && i + 1 < argc) name_filter = argv[++i];
        else if (std::strcmp(arg, "-query-extent") == 0) query_extent = true;
        else if (std::strcmp(arg, "--json") == 0) json_out = true;
        else if (std::strcmp(arg, "--pretty") == 0) pretty = true;
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(arg, "-vv") == 0 || std::strcmp(arg, "--debug") == 0)
            verbosity = 2;
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage();
            return 0;
        } else if (!cli::parse_common_flag(cfg, argc, argv, i)) {
            positional.push_back(arg);
        }
    }

    cli::set_verbosity(verbosity);

    std::set<uint32_t> wanted;
    std::shared_ptr<const locconfig::LocationConfigTable> configs;

    try {
        auto source = cli::open_cache(cfg);

        if (!name_filter.empty() || !json_out) {
            LOGI("Loading location configs from", cfg.cache);
            configs = locconfig::LocationConfigTable::load(*source);
            LOGI("Location configs:", configs->size());
        }

        if (!name_filter.empty()) {
            auto needle = lower(name_filter);
            for (const auto& [id, loc] : *configs) {
                if (loc.name && lower(*loc.name).find(needle) != std::string::npos) wanted.insert(id);
            }
            if (wanted.empty()) {
                std::cerr << "No location names contain '" << name_filter << "'\n";
                return 1;
            }
        }
        for (const auto& p : positional) wanted.insert(static_cast<uint32_t>(std::stoul(p)));
        if (wanted.empty()) wanted.insert(6560);

        auto grid = query_extent ? mapsquare::MapSquareGrid::with_queried_extent(*source)
                                 : mapsquare::MapSquareGrid(*source, cfg.extent);
        LOGI("Grid:", grid.extent().width, "x", grid.extent().height, "squares,", cfg.threads, "threads");

        mapsquare::MapSquareDecoder decoder(*source);
        mapsquare::ScanOptions opts;
        opts.threads = cfg.threads;
        opts.filter = [&wanted](const mapsquare::Coord&, const mapsquare::PlacedLocation& loc) {
            return wanted.count(loc.id) > 0;
        };

        auto start = std::chrono::steady_clock::now();
        auto result = mapsquare::scan(grid, decoder, opts);
        auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        for (const auto& f : result.failures) {
            LOGW(std::format("square ({}, {}):", f.square.i, f.square.j), f.message);
        }

        if (json_out) {
            json arr = json::array();
            for (const auto& p : result.placements) arr.push_back(cli::placement_json(p.square, p.location));
            cli::write_json(std::cout, arr, pretty);
        } else {
            for (const auto& p : result.placements) {
                const auto* loc = configs->get(p.location.id);
                auto world = mapsquare::world_tile(p.square, p.location);
                std::cout << std::format("{} {:<24} world ({}, {}, {}) square ({}, {}) {} {}\n",
                                         p.location.id,
                                         loc && loc->name ? *loc->name : "-",
                                         world.x, world.y, world.plane,
                                         p.square.i, p.square.j,
                                         mapsquare::location_type_name(p.location.type),
                                         mapsquare::orientation_name(p.location.orientation));
            }
        }

        std::cerr << std::format("Scanned {} squares in {:.2f}s: {} decoded, {} empty, {} failed\n",
                                 result.squares_visited, elapsed, result.squares_decoded,
                                 result.squares_absent, result.failures.size());
        std::cerr << "Found " << result.placements.size() << " placements\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
