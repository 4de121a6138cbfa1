#include "rstools/cache.h"
#include "rstools/locconfig.h"

#include <algorithm>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../common/cli_logger.h"
#include "../common/tool_config.h"

using namespace rstools;
using cli::json;
using locconfig::LocFlag;

static const std::pair<LocFlag, const char*> flag_names[] = {
    {LocFlag::Walkable, "walkable"},
    {LocFlag::ProjectilePassable, "projectilePassable"},
    {LocFlag::ContouredGround, "contouredGround"},
    {LocFlag::MergeNormals, "mergeNormals"},
    {LocFlag::Occludes, "occludes"},
    {LocFlag::Mirrored, "mirrored"},
    {LocFlag::ShadowDisabled, "shadowDisabled"},
    {LocFlag::ObstructsGround, "obstructsGround"},
    {LocFlag::Hollow, "hollow"},
    {LocFlag::RandomAnimationStart, "randomAnimationStart"},
};

template <typename T>
static json opt_json(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

static json pairs_json(const std::vector<std::pair<uint16_t, uint16_t>>& v) {
    json arr = json::array();
    for (const auto& [from, to] : v) arr.push_back({from, to});
    return arr;
}

static json location_json(const locconfig::LocationConfig& loc) {
    json flags = json::array();
    for (const auto& [flag, name] : flag_names) {
        if (loc.has(flag)) flags.push_back(name);
    }

    json actions = json::array();
    for (const auto& a : loc.actions) actions.push_back(opt_json(a));

    json j = {
        {"id", loc.id},
        {"name", opt_json(loc.name)},
        {"models", loc.models},
        {"modelTypes", loc.model_types},
        {"flags", flags},
        {"sizeX", loc.size_x},
        {"sizeY", loc.size_y},
        {"interactType", loc.interact_type},
        {"wallOrDoor", loc.wall_or_door},
        {"contouredGround", loc.contoured_ground},
        {"animation", opt_json(loc.animation)},
        {"decorDisplacement", loc.decor_displacement},
        {"ambient", loc.ambient},
        {"contrast", loc.contrast},
        {"actions", actions},
        {"recolors", pairs_json(loc.recolors)},
        {"retextures", pairs_json(loc.retextures)},
        {"category", opt_json(loc.category)},
        {"modelScale", {loc.model_scale_x, loc.model_scale_height, loc.model_scale_y}},
        {"offset", {loc.offset_x, loc.offset_height, loc.offset_y}},
        {"mapScene", opt_json(loc.map_scene)},
        {"mapArea", opt_json(loc.map_area)},
        {"blockingMask", loc.blocking_mask},
        {"supportsItems", opt_json(loc.supports_items)},
    };

    if (loc.transforms) {
        json ids = json::array();
        for (const auto& id : loc.transforms->ids) ids.push_back(opt_json(id));
        j["transforms"] = {
            {"varbit", opt_json(loc.transforms->varbit)},
            {"varp", opt_json(loc.transforms->varp)},
            {"ids", ids},
        };
    }
    if (loc.ambient_sound) {
        const auto& s = *loc.ambient_sound;
        j["ambientSound"] = {
            {"soundId", s.sound_id},
            {"distance", s.distance},
            {"retain", s.retain},
            {"minDelay", s.min_delay},
            {"maxDelay", s.max_delay},
            {"ids", s.ids},
        };
    }
    if (!loc.params.empty()) {
        json params = json::object();
        for (const auto& [key, value] : loc.params) {
            auto k = std::to_string(key);
            if (const auto* s = std::get_if<std::string>(&value)) params[k] = *s;
            else params[k] = std::get<int32_t>(value);
        }
        j["params"] = params;
    }
    return j;
}

static void print_usage() {
    std::cerr << "Usage: loc_dump [flags] [output.json]\n\n"
              << "Exports location configs as a JSON array sorted by id.\n"
              << "Writes to stdout when no output path is given or it is '-'.\n\n"
              << "Flags:\n"
              << "  -config <path>   Config file (JSON)\n"
              << "  -cache <dir>     Cache directory (main_file_cache.dat2)\n"
              << "  -id <n>          Export a single location\n"
              << "  -sound-retain    Ambient sound opcodes carry a retain byte\n"
              << "  --pretty         Pretty-print JSON output\n"
              << "  -v, --verbose    Enable verbose logging\n";
}

int main(int argc, char* argv[]) {
    cli::Config cfg;
    locconfig::Options opts;
    std::optional<uint32_t> only_id;
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
        else if (std::strcmp(arg, "-id") == 0 && i + 1 < argc)
            only_id = static_cast<uint32_t>(std::stoul(argv[++i]));
        else if (std::strcmp(arg, "-sound-retain") == 0) opts.sound_retain = true;
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

    std::string output = positional.empty() ? "-" : positional[0];

    try {
        auto source = cli::open_cache(cfg);
        LOGI("Loading location configs from", cfg.cache);
        auto table = locconfig::LocationConfigTable::load(*source, opts);

        json arr = json::array();
        if (only_id) {
            const auto* loc = table->get(*only_id);
            if (!loc) {
                std::cerr << "Error: no location " << *only_id << '\n';
                return 1;
            }
            arr.push_back(location_json(*loc));
        } else {
            for (const auto& [id, loc] : *table) arr.push_back(location_json(loc));
        }

        if (output == "-") {
            cli::write_json(std::cout, arr, pretty);
        } else {
            cli::write_json_file(output, arr, pretty);
            std::cerr << "Wrote " << arr.size() << " locations to " << output << '\n';
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
