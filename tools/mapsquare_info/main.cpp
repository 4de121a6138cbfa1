#include "rstools/binutil.h"
#include "rstools/cache.h"
#include "rstools/locconfig.h"
#include "rstools/mapsquare.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/tool_config.h"

using namespace rstools;
using cli::json;

// Exit codes distinguish an empty square from a broken one.
constexpr int kExitMalformed = 1;
constexpr int kExitAbsent = 2;

static void print_usage() {
    std::cerr << "Usage: mapsquare_info [flags] <i> <j>\n\n"
              << "Decodes the locations of one map square and prints them as JSON.\n"
              << "Exit status is 2 when the square has no location data and 1 when\n"
              << "its data is malformed.\n\n"
              << "Flags:\n"
              << "  -config <path>   Config file (JSON)\n"
              << "  -cache <dir>     Cache directory (main_file_cache.dat2)\n"
              << "  -keys <path>     XTEA keys (JSON)\n"
              << "  -width <n>       Grid width in squares (default 100)\n"
              << "  -height <n>      Grid height in squares (default 200)\n"
              << "  --names          Include location names\n"
              << "  --summary        Print counts per location id instead\n"
              << "  --pretty         Pretty-print JSON output\n"
              << "  -v, --verbose    Enable verbose logging\n";
}

int main(int argc, char* argv[]) {
    cli::Config cfg;
    bool names = false;
    bool summary = false;
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
        else if (std::strcmp(arg, "--names") == 0) names = true;
        else if (std::strcmp(arg, "--summary") == 0) summary = true;
        else if (std::strcmp(arg, "--pretty") == 0) pretty = true;
        else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            print_usage();
            return 0;
        } else if (!cli::parse_common_flag(cfg, argc, argv, i)) {
            positional.push_back(arg);
        }
    }

    cli::set_verbosity(verbosity);

    if (positional.size() != 2) {
        print_usage();
        return 1;
    }

    try {
        auto i = static_cast<uint32_t>(std::stoul(positional[0]));
        auto j = static_cast<uint32_t>(std::stoul(positional[1]));

        auto source = cli::open_cache(cfg);
        mapsquare::MapSquareGrid grid(*source, cfg.extent);
        auto square = grid.get(i, j);
        if (const auto& key = square.locations_key())
            LOGI("Square", i, j, "-> archive", key->index, "/", key->archive);

        mapsquare::MapSquareDecoder decoder(*source);
        std::vector<mapsquare::PlacedLocation> locs;
        try {
            locs = decoder.locations(square);
        } catch (const mapsquare::AbsentError& e) {
            std::cerr << "Absent: " << e.what() << '\n';
            return kExitAbsent;
        } catch (const binutil::DecodeError& e) {
            std::cerr << "Malformed: " << e.what() << '\n';
            return kExitMalformed;
        } catch (const cache::CacheError& e) {
            std::cerr << "Malformed: " << e.what() << '\n';
            return kExitMalformed;
        }

        std::shared_ptr<const locconfig::LocationConfigTable> configs;
        if (names) configs = locconfig::LocationConfigTable::load(*source);
        auto name_of = [&](uint32_t id) -> json {
            const auto* loc = configs ? configs->get(id) : nullptr;
            return loc && loc->name ? json(*loc->name) : json(nullptr);
        };

        json doc = {
            {"square", {{"i", i}, {"j", j}, {"id", square.coord().id()}}},
            {"count", locs.size()},
        };

        if (summary) {
            std::map<uint32_t, int> counts;
            for (const auto& loc : locs) counts[loc.id]++;
            json arr = json::array();
            for (const auto& [id, n] : counts) {
                json e = {{"id", id}, {"count", n}};
                if (names) e["name"] = name_of(id);
                arr.push_back(std::move(e));
            }
            doc["locations"] = std::move(arr);
        } else {
            json arr = json::array();
            for (const auto& loc : locs) {
                auto e = cli::placement_json(square.coord(), loc);
                if (names) e["name"] = name_of(loc.id);
                arr.push_back(std::move(e));
            }
            doc["locations"] = std::move(arr);
        }

        cli::write_json(std::cout, doc, pretty);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
