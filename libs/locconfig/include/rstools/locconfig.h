#pragma once

#include "rstools/cache.h"

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rstools::locconfig {

// Boolean attributes set by flag opcodes. All default to unset.
enum class LocFlag : uint32_t {
    Walkable = 1u << 0,             // 17
    ProjectilePassable = 1u << 1,   // 17, 18
    ContouredGround = 1u << 2,      // 21
    MergeNormals = 1u << 3,         // 22
    Occludes = 1u << 4,             // 23
    Mirrored = 1u << 5,             // 62
    ShadowDisabled = 1u << 6,       // 64
    ObstructsGround = 1u << 7,      // 73
    Hollow = 1u << 8,               // 74
    RandomAnimationStart = 1u << 9, // 89
};

struct Transforms {
    std::optional<uint16_t> varbit;
    std::optional<uint16_t> varp;
    std::vector<std::optional<uint32_t>> ids; // last entry is the default

    bool operator==(const Transforms&) const = default;
};

struct AmbientSound {
    uint16_t sound_id = 0;
    uint8_t distance = 0;
    uint8_t retain = 0;
    uint16_t min_delay = 0;     // random sounds only
    uint16_t max_delay = 0;     // random sounds only
    std::vector<uint16_t> ids;  // random sounds only

    bool operator==(const AmbientSound&) const = default;
};

using ParamValue = std::variant<int32_t, std::string>;

struct LocationConfig {
    uint32_t id = 0;
    std::optional<std::string> name;
    std::vector<uint32_t> models;
    std::vector<uint8_t> model_types; // parallel to models when stored with types
    uint32_t flags = 0;

    uint8_t size_x = 1;
    uint8_t size_y = 1;
    int interact_type = 2;
    int wall_or_door = -1;
    int contoured_ground = -1;
    std::optional<uint16_t> animation;
    uint8_t decor_displacement = 16;
    int8_t ambient = 0;
    int contrast = 0;
    std::array<std::optional<std::string>, 5> actions;
    std::vector<std::pair<uint16_t, uint16_t>> recolors;
    std::vector<std::pair<uint16_t, uint16_t>> retextures;
    std::optional<uint16_t> category;
    uint16_t model_scale_x = 128;
    uint16_t model_scale_height = 128;
    uint16_t model_scale_y = 128;
    std::optional<uint16_t> map_scene;
    std::optional<uint16_t> map_area;
    uint8_t blocking_mask = 0;
    int16_t offset_x = 0;
    int16_t offset_height = 0;
    int16_t offset_y = 0;
    std::optional<uint8_t> supports_items;
    std::optional<Transforms> transforms;
    std::optional<AmbientSound> ambient_sound;
    std::map<uint32_t, ParamValue> params;

    bool has(LocFlag f) const { return (flags & static_cast<uint32_t>(f)) != 0; }

    bool operator==(const LocationConfig&) const = default;
};

struct Options {
    // Newer caches store an extra "retain" byte in ambient sound opcodes 78/79.
    bool sound_retain = false;
};

// LocationConfigTable maps location ids to their configs. Decoding is all or
// nothing; the finished table is immutable and safe to share across threads.
class LocationConfigTable {
public:
    using const_iterator = std::map<uint32_t, LocationConfig>::const_iterator;

    // decode parses a config group whose file ids are the location ids.
    // Throws binutil::MalformedRecord if any record is inconsistent.
    static LocationConfigTable decode(std::span<const uint8_t> group,
                                      std::span<const uint32_t> file_ids,
                                      Options opts = {});

    // decode_file parses a single location record.
    static LocationConfig decode_file(uint32_t id, std::span<const uint8_t> data, Options opts = {});

    // load fetches the location config group from the cache and decodes it.
    // Throws cache::CacheError if the group cannot be found.
    static std::shared_ptr<const LocationConfigTable> load(const cache::CacheSource& source,
                                                           Options opts = {});

    // get returns nullptr for ids not in the table.
    const LocationConfig* get(uint32_t id) const;

    size_t size() const { return configs_.size(); }
    bool empty() const { return configs_.empty(); }
    const_iterator begin() const { return configs_.begin(); }
    const_iterator end() const { return configs_.end(); }

private:
    std::map<uint32_t, LocationConfig> configs_;
};

} // namespace rstools::locconfig
