#pragma once

// Builders for synthetic caches used by the library tests.

#include "rstools/cache.h"
#include "rstools/js5.h"
#include "rstools/mapsquare.h"

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <format>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace rstools::fixture {

// ByteWriter appends big-endian fields, mirroring binutil::ByteCursor.
class ByteWriter {
public:
    ByteWriter& u8(uint32_t v) { buf_.push_back(static_cast<uint8_t>(v)); return *this; }
    ByteWriter& u16(uint32_t v) { return u8(v >> 8).u8(v); }
    ByteWriter& u24(uint32_t v) { return u8(v >> 16).u8(v >> 8).u8(v); }
    ByteWriter& u32(uint32_t v) { return u8(v >> 24).u8(v >> 16).u8(v >> 8).u8(v); }
    ByteWriter& i32(int32_t v) { return u32(static_cast<uint32_t>(v)); }

    ByteWriter& smart(uint32_t v) {
        if (v < 0x80) return u8(v);
        return u16(v + 0x8000);
    }

    ByteWriter& extended_smart(uint32_t v) {
        while (v >= 0x7FFF) {
            smart(0x7FFF);
            v -= 0x7FFF;
        }
        return smart(v);
    }

    ByteWriter& big_smart(uint32_t v) {
        if (v < 0x8000) return u16(v);
        return u32(v | 0x80000000u);
    }

    ByteWriter& string(std::string_view s) {
        buf_.insert(buf_.end(), s.begin(), s.end());
        return u8(0);
    }

    ByteWriter& bytes(std::span<const uint8_t> b) {
        buf_.insert(buf_.end(), b.begin(), b.end());
        return *this;
    }

    const std::vector<uint8_t>& data() const { return buf_; }
    size_t size() const { return buf_.size(); }

private:
    std::vector<uint8_t> buf_;
};

// --- Containers ---

inline std::vector<uint8_t> container_none(std::span<const uint8_t> payload) {
    ByteWriter w;
    w.u8(0).u32(static_cast<uint32_t>(payload.size())).bytes(payload);
    return w.data();
}

inline std::vector<uint8_t> gzip(std::span<const uint8_t> payload) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw std::runtime_error("deflateInit2 failed");

    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(payload.size())) + 32);
    zs.next_in = const_cast<Bytef*>(payload.data());
    zs.avail_in = static_cast<uInt>(payload.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw std::runtime_error("deflate failed");
    return out;
}

inline std::vector<uint8_t> container_gzip(std::span<const uint8_t> payload) {
    auto packed = gzip(payload);
    ByteWriter w;
    w.u8(2).u32(static_cast<uint32_t>(packed.size())).u32(static_cast<uint32_t>(payload.size())).bytes(packed);
    return w.data();
}

// xtea_encrypt encrypts a container body in place, the inverse of
// js5::decompress with a key. The header and any version trailer stay clear.
inline void xtea_encrypt(std::vector<uint8_t>& container, const js5::XteaKey& key) {
    constexpr uint32_t delta = 0x9E3779B9;
    uint32_t k[4];
    for (int i = 0; i < 4; i++) k[i] = static_cast<uint32_t>(key.k[i]);

    size_t length = (size_t(container[1]) << 24) | (size_t(container[2]) << 16) |
                    (size_t(container[3]) << 8) | container[4];
    size_t body = length + (container[0] == 0 ? 0 : 4);
    size_t blocks = body / 8;
    for (size_t b = 0; b < blocks; b++) {
        uint8_t* p = container.data() + 5 + b * 8;
        uint32_t v0 = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3];
        uint32_t v1 = (uint32_t(p[4]) << 24) | (uint32_t(p[5]) << 16) | (uint32_t(p[6]) << 8) | p[7];
        uint32_t sum = 0;
        for (int r = 0; r < 32; r++) {
            v0 += (((v1 << 4) ^ (v1 >> 5)) + v1) ^ (sum + k[sum & 3]);
            sum += delta;
            v1 += (((v0 << 4) ^ (v0 >> 5)) + v0) ^ (sum + k[(sum >> 11) & 3]);
        }
        for (int i = 0; i < 4; i++) {
            p[i] = static_cast<uint8_t>(v0 >> (24 - 8 * i));
            p[4 + i] = static_cast<uint8_t>(v1 >> (24 - 8 * i));
        }
    }
}

// with_version appends the 2-byte version trailer archives carry on disk.
inline std::vector<uint8_t> with_version(std::vector<uint8_t> container, uint16_t version) {
    container.push_back(static_cast<uint8_t>(version >> 8));
    container.push_back(static_cast<uint8_t>(version));
    return container;
}

// --- Reference tables and groups ---

struct GroupSpec {
    uint32_t id = 0;
    std::string name; // empty = unnamed (hash 0)
    std::vector<uint32_t> file_ids{0};
};

// reference_table encodes an uncompressed reference table. Groups must be
// sorted by id.
inline std::vector<uint8_t> reference_table(const std::vector<GroupSpec>& groups, uint8_t protocol = 6,
                                            bool named = true) {
    ByteWriter w;
    auto count = [&](uint32_t v) {
        if (protocol >= 7) w.big_smart(v);
        else w.u16(v);
    };

    w.u8(protocol);
    if (protocol >= 6) w.i32(1);
    w.u8(named ? js5::table_flags::kNames : 0);

    count(static_cast<uint32_t>(groups.size()));
    uint32_t prev = 0;
    for (const auto& g : groups) {
        count(g.id - prev);
        prev = g.id;
    }
    if (named) {
        for (const auto& g : groups) w.i32(g.name.empty() ? 0 : js5::name_hash(g.name));
    }
    for (size_t i = 0; i < groups.size(); i++) w.i32(0x1000 + static_cast<int32_t>(i)); // checksums
    for (size_t i = 0; i < groups.size(); i++) w.i32(1);                                   // versions
    for (const auto& g : groups) count(static_cast<uint32_t>(g.file_ids.size()));
    for (const auto& g : groups) {
        uint32_t fprev = 0;
        for (auto f : g.file_ids) {
            count(f - fprev);
            fprev = f;
        }
    }
    if (named) {
        for (const auto& g : groups) {
            for (size_t i = 0; i < g.file_ids.size(); i++) w.i32(0);
        }
    }
    return w.data();
}

// pack_group joins files into a single-chunk group.
inline std::vector<uint8_t> pack_group(const std::vector<std::vector<uint8_t>>& files) {
    if (files.size() == 1) return files[0];
    ByteWriter w;
    for (const auto& f : files) w.bytes(f);
    int32_t prev = 0;
    for (const auto& f : files) {
        int32_t n = static_cast<int32_t>(f.size());
        w.i32(n - prev);
        prev = n;
    }
    w.u8(1);
    return w.data();
}

// --- Record encoders ---

// location_record encodes a config with a name and plain models.
inline std::vector<uint8_t> location_record(std::string_view name, const std::vector<uint16_t>& models) {
    ByteWriter w;
    if (!models.empty()) {
        w.u8(5).u8(static_cast<uint32_t>(models.size()));
        for (auto m : models) w.u16(m);
    }
    if (!name.empty()) w.u8(2).string(name);
    w.u8(0);
    return w.data();
}

inline uint32_t packed_position(const mapsquare::PlacedLocation& loc) {
    return (uint32_t(loc.plane) << 12) | (uint32_t(loc.x) << 6) | loc.y;
}

// encode_locations writes placements in the cache's delta form. Placements
// are ordered by id, then packed position.
inline std::vector<uint8_t> encode_locations(std::vector<mapsquare::PlacedLocation> locs) {
    std::stable_sort(locs.begin(), locs.end(), [](const auto& a, const auto& b) {
        if (a.id != b.id) return a.id < b.id;
        return packed_position(a) < packed_position(b);
    });

    ByteWriter w;
    int64_t prev_id = -1;
    size_t n = 0;
    while (n < locs.size()) {
        uint32_t id = locs[n].id;
        w.extended_smart(static_cast<uint32_t>(id - prev_id));
        prev_id = id;

        uint32_t prev_pos = 0;
        for (; n < locs.size() && locs[n].id == id; n++) {
            uint32_t pos = packed_position(locs[n]);
            w.smart(pos - prev_pos + 1);
            prev_pos = pos;
            w.u8((static_cast<uint32_t>(locs[n].type) << 2) | static_cast<uint32_t>(locs[n].orientation));
        }
        w.smart(0);
    }
    w.extended_smart(0);
    return w.data();
}

inline mapsquare::PlacedLocation placed(uint32_t id, uint8_t plane, uint8_t x, uint8_t y,
                                        mapsquare::LocationType type = mapsquare::LocationType::CentrepieceStraight,
                                        mapsquare::Orientation o = mapsquare::Orientation::West) {
    mapsquare::PlacedLocation loc;
    loc.id = id;
    loc.plane = plane;
    loc.x = x;
    loc.y = y;
    loc.type = type;
    loc.orientation = o;
    return loc;
}

// --- Whole caches ---

// CacheBuilder assembles a MemorySource with location configs (index 2,
// group 6) and map squares (index 5) plus their reference tables. Archives
// are stored decoded, as a CacheSource returns them.
class CacheBuilder {
public:
    CacheBuilder& location(uint32_t id, std::vector<uint8_t> record) {
        configs_[id] = std::move(record);
        return *this;
    }

    // square stores the location record of (i, j).
    CacheBuilder& square(uint32_t i, uint32_t j, std::vector<uint8_t> locations) {
        squares_[{i, j}] = std::move(locations);
        return *this;
    }

    // listed_only registers a square in the reference table without storing
    // its archive.
    CacheBuilder& listed_only(uint32_t i, uint32_t j) {
        listed_only_.push_back({i, j});
        return *this;
    }

    cache::MemorySource build() const {
        cache::MemorySource src;

        std::vector<uint32_t> ids;
        std::vector<std::vector<uint8_t>> files;
        for (const auto& [id, rec] : configs_) {
            ids.push_back(id);
            files.push_back(rec);
        }
        std::vector<GroupSpec> config_groups;
        if (!ids.empty()) {
            config_groups.push_back(GroupSpec{js5::kLocationConfigGroup, "", ids});
            src.put(js5::kConfigIndex, js5::kLocationConfigGroup, pack_group(files));
        }
        src.put(js5::kReferenceIndex, js5::kConfigIndex, reference_table(config_groups));

        std::vector<GroupSpec> map_groups;
        uint32_t next_group = 0;
        for (const auto& [coord, data] : squares_) {
            // Terrain groups share the index and must not be mistaken for locations.
            map_groups.push_back(GroupSpec{next_group++, std::format("m{}_{}", coord.i, coord.j)});
            uint32_t gid = next_group++;
            map_groups.push_back(GroupSpec{gid, mapsquare::locations_archive_name(coord.i, coord.j)});
            src.put(js5::kMapIndex, gid, data);
        }
        for (const auto& coord : listed_only_) {
            map_groups.push_back(GroupSpec{next_group++, mapsquare::locations_archive_name(coord.i, coord.j)});
        }
        src.put(js5::kReferenceIndex, js5::kMapIndex, reference_table(map_groups));
        return src;
    }

private:
    std::map<uint32_t, std::vector<uint8_t>> configs_;
    std::map<mapsquare::Coord, std::vector<uint8_t>> squares_;
    std::vector<mapsquare::Coord> listed_only_;
};

} // namespace rstools::fixture
