#include "rstools/locconfig.h"
#include "rstools/binutil.h"
#include "rstools/js5.h"

#include <cctype>
#include <format>

namespace rstools::locconfig {

using binutil::ByteCursor;
using binutil::MalformedRecord;
using binutil::OutOfBounds;

static bool iequals(const std::string& a, const char* b) {
    size_t n = std::char_traits<char>::length(b);
    if (a.size() != n) return false;
    for (size_t i = 0; i < n; i++) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

static std::optional<uint16_t> u16_or_none(ByteCursor& c) {
    uint16_t v = c.read_u16();
    if (v == 0xFFFF) return std::nullopt;
    return v;
}

static void set_flag(LocationConfig& loc, LocFlag f) {
    loc.flags |= static_cast<uint32_t>(f);
}

static Transforms read_transforms(ByteCursor& c, bool with_default) {
    Transforms t;
    t.varbit = u16_or_none(c);
    t.varp = u16_or_none(c);

    std::optional<uint32_t> fallback;
    if (with_default) {
        if (auto v = u16_or_none(c)) fallback = *v;
    }

    size_t n = c.read_u8();
    t.ids.reserve(n + 2);
    for (size_t i = 0; i <= n; i++) {
        auto v = u16_or_none(c);
        t.ids.push_back(v ? std::optional<uint32_t>(*v) : std::nullopt);
    }
    t.ids.push_back(fallback);
    return t;
}

static void read_params(ByteCursor& c, std::map<uint32_t, ParamValue>& params) {
    size_t n = c.read_u8();
    for (size_t i = 0; i < n; i++) {
        bool is_string = c.read_u8() == 1;
        uint32_t key = c.read_u24();
        if (is_string) params[key] = c.read_string();
        else params[key] = c.read_i32();
    }
}

// Decodes one opcode. Returns false on the terminator.
static bool read_opcode(ByteCursor& c, LocationConfig& loc, const Options& opts) {
    uint8_t op = c.read_u8();
    switch (op) {
    case 0:
        return false;
    case 1: {
        size_t n = c.read_u8();
        loc.models.clear();
        loc.model_types.clear();
        for (size_t i = 0; i < n; i++) {
            loc.models.push_back(c.read_u16());
            loc.model_types.push_back(c.read_u8());
        }
        break;
    }
    case 2: {
        auto name = c.read_string();
        if (name == "null") loc.name.reset();
        else loc.name = std::move(name);
        break;
    }
    case 5: {
        size_t n = c.read_u8();
        loc.models.clear();
        loc.model_types.clear();
        for (size_t i = 0; i < n; i++) loc.models.push_back(c.read_u16());
        break;
    }
    case 14: loc.size_x = c.read_u8(); break;
    case 15: loc.size_y = c.read_u8(); break;
    case 17:
        loc.interact_type = 0;
        set_flag(loc, LocFlag::Walkable);
        set_flag(loc, LocFlag::ProjectilePassable);
        break;
    case 18: set_flag(loc, LocFlag::ProjectilePassable); break;
    case 19: loc.wall_or_door = c.read_u8(); break;
    case 21:
        loc.contoured_ground = 0;
        set_flag(loc, LocFlag::ContouredGround);
        break;
    case 22: set_flag(loc, LocFlag::MergeNormals); break;
    case 23: set_flag(loc, LocFlag::Occludes); break;
    case 24: loc.animation = u16_or_none(c); break;
    case 27: loc.interact_type = 1; break;
    case 28: loc.decor_displacement = c.read_u8(); break;
    case 29: loc.ambient = c.read_i8(); break;
    case 30: case 31: case 32: case 33: case 34: {
        auto action = c.read_string();
        auto& slot = loc.actions[op - 30];
        if (iequals(action, "hidden")) slot.reset();
        else slot = std::move(action);
        break;
    }
    case 39: loc.contrast = c.read_i8() * 25; break;
    case 40:
    case 41: {
        auto& dst = op == 40 ? loc.recolors : loc.retextures;
        size_t n = c.read_u8();
        dst.clear();
        for (size_t i = 0; i < n; i++) {
            uint16_t from = c.read_u16();
            uint16_t to = c.read_u16();
            dst.emplace_back(from, to);
        }
        break;
    }
    case 61: loc.category = c.read_u16(); break;
    case 62: set_flag(loc, LocFlag::Mirrored); break;
    case 64: set_flag(loc, LocFlag::ShadowDisabled); break;
    case 65: loc.model_scale_x = c.read_u16(); break;
    case 66: loc.model_scale_height = c.read_u16(); break;
    case 67: loc.model_scale_y = c.read_u16(); break;
    case 68: loc.map_scene = c.read_u16(); break;
    case 69: loc.blocking_mask = c.read_u8(); break;
    case 70: loc.offset_x = c.read_i16(); break;
    case 71: loc.offset_height = c.read_i16(); break;
    case 72: loc.offset_y = c.read_i16(); break;
    case 73: set_flag(loc, LocFlag::ObstructsGround); break;
    case 74: set_flag(loc, LocFlag::Hollow); break;
    case 75: loc.supports_items = c.read_u8(); break;
    case 77: loc.transforms = read_transforms(c, false); break;
    case 92: loc.transforms = read_transforms(c, true); break;
    case 78: {
        AmbientSound s;
        s.sound_id = c.read_u16();
        s.distance = c.read_u8();
        if (opts.sound_retain) s.retain = c.read_u8();
        loc.ambient_sound = std::move(s);
        break;
    }
    case 79: {
        AmbientSound s;
        s.min_delay = c.read_u16();
        s.max_delay = c.read_u16();
        s.distance = c.read_u8();
        if (opts.sound_retain) s.retain = c.read_u8();
        size_t n = c.read_u8();
        for (size_t i = 0; i < n; i++) s.ids.push_back(c.read_u16());
        loc.ambient_sound = std::move(s);
        break;
    }
    case 81:
        loc.contoured_ground = c.read_u8() * 256;
        set_flag(loc, LocFlag::ContouredGround);
        break;
    case 82: loc.map_area = c.read_u16(); break;
    case 89: set_flag(loc, LocFlag::RandomAnimationStart); break;
    case 249: read_params(c, loc.params); break;
    default: {
        // Opcodes added after this decoder was written carry their payload
        // length so they can be stepped over.
        size_t len = c.read_smart();
        if (len > c.remaining())
            throw MalformedRecord(std::format(
                "locconfig: id {}: unknown opcode {} declares {} bytes, {} remain",
                loc.id, op, len, c.remaining()));
        c.skip(len);
        break;
    }
    }
    return true;
}

LocationConfig LocationConfigTable::decode_file(uint32_t id, std::span<const uint8_t> data, Options opts) {
    LocationConfig loc;
    loc.id = id;

    ByteCursor c(data);
    try {
        while (read_opcode(c, loc, opts)) {}
    } catch (const OutOfBounds& e) {
        throw MalformedRecord(std::format("locconfig: id {}: truncated record: {}", id, e.what()));
    }
    if (!c.at_end())
        throw MalformedRecord(std::format(
            "locconfig: id {}: {} bytes after terminator", id, c.remaining()));
    return loc;
}

LocationConfigTable LocationConfigTable::decode(std::span<const uint8_t> group,
                                                std::span<const uint32_t> file_ids,
                                                Options opts) {
    auto files = js5::split_group(group, file_ids.size());

    LocationConfigTable table;
    for (size_t i = 0; i < file_ids.size(); i++) {
        uint32_t id = file_ids[i];
        auto loc = decode_file(id, files[i], opts);
        if (!table.configs_.emplace(id, std::move(loc)).second)
            throw MalformedRecord(std::format("locconfig: duplicate id {}", id));
    }
    return table;
}

std::shared_ptr<const LocationConfigTable> LocationConfigTable::load(const cache::CacheSource& source,
                                                                     Options opts) {
    auto ref = cache::load_reference_table(source, js5::kConfigIndex);
    const auto* entry = ref.find(js5::kLocationConfigGroup);
    if (!entry)
        throw cache::CacheError(std::format(
            "locconfig: config index has no group {}", js5::kLocationConfigGroup));

    auto data = source.fetch(js5::kConfigIndex, js5::kLocationConfigGroup);
    if (!data)
        throw cache::CacheError(std::format(
            "locconfig: group {}/{} not found", js5::kConfigIndex, js5::kLocationConfigGroup));

    return std::make_shared<LocationConfigTable>(decode(*data, entry->file_ids, opts));
}

const LocationConfig* LocationConfigTable::get(uint32_t id) const {
    auto it = configs_.find(id);
    return it == configs_.end() ? nullptr : &it->second;
}

} // namespace rstools::locconfig
