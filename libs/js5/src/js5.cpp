#include "rstools/js5.h"
#include "rstools/binutil.h"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <format>

namespace rstools::js5 {

using binutil::ByteCursor;
using binutil::MalformedRecord;
using binutil::OutOfBounds;

// ---------------------------------------------------------------------------
// XTEA
// ---------------------------------------------------------------------------

static constexpr uint32_t kXteaDelta = 0x9E3779B9;
static constexpr int kXteaRounds = 32;

static uint32_t load_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

static void store_be32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

void xtea_decrypt(std::span<uint8_t> data, const XteaKey& key) {
    uint32_t k[4];
    for (int i = 0; i < 4; i++) k[i] = static_cast<uint32_t>(key.k[i]);

    size_t blocks = data.size() / 8;
    for (size_t b = 0; b < blocks; b++) {
        uint8_t* p = data.data() + b * 8;
        uint32_t v0 = load_be32(p);
        uint32_t v1 = load_be32(p + 4);
        uint32_t sum = kXteaDelta * static_cast<uint32_t>(kXteaRounds);
        for (int r = 0; r < kXteaRounds; r++) {
            v1 -= (((v0 << 4) ^ (v0 >> 5)) + v0) ^ (sum + k[(sum >> 11) & 3]);
            sum -= kXteaDelta;
            v0 -= (((v1 << 4) ^ (v1 >> 5)) + v1) ^ (sum + k[sum & 3]);
        }
        store_be32(p, v0);
        store_be32(p + 4, v1);
    }
}

// ---------------------------------------------------------------------------
// Containers
// ---------------------------------------------------------------------------

static std::vector<uint8_t> gunzip(std::span<const uint8_t> src, uint32_t expected_size) {
    if (src.size() < 2 || src[0] != 0x1F || src[1] != 0x8B)
        throw MalformedRecord("js5: gzip payload has no gzip header");

    std::vector<uint8_t> out(std::max<uint32_t>(expected_size, 1));

    z_stream zs{};
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK)
        throw std::runtime_error("js5: inflateInit2 failed");

    zs.next_in = const_cast<Bytef*>(src.data());
    zs.avail_in = static_cast<uInt>(src.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    int rc = inflate(&zs, Z_FINISH);
    uLong produced = zs.total_out;
    inflateEnd(&zs);

    if (rc != Z_STREAM_END)
        throw MalformedRecord(std::format("js5: gzip payload is corrupt (zlib error {})", rc));
    if (produced != expected_size)
        throw MalformedRecord(std::format(
            "js5: gzip payload inflated to {} bytes, header says {}", produced, expected_size));

    out.resize(expected_size);
    return out;
}

std::vector<uint8_t> decompress(std::span<const uint8_t> container, const XteaKey* key) {
    // The header stays in the clear. Encryption covers the body only, never
    // the version trailer some archives carry after it.
    std::vector<uint8_t> decrypted;
    if (key && !key->is_zero() && container.size() > 5) {
        uint8_t type = container[0];
        uint64_t length = load_be32(container.data() + 1);
        uint64_t end = 5 + length + (type == static_cast<uint8_t>(Compression::None) ? 0 : 4);
        end = std::min<uint64_t>(end, container.size());

        decrypted.assign(container.begin(), container.end());
        xtea_decrypt(std::span<uint8_t>(decrypted).subspan(5, static_cast<size_t>(end - 5)), *key);
        container = decrypted;
    }

    try {
        ByteCursor c(container);
        uint8_t type = c.read_u8();
        uint32_t length = c.read_u32();

        switch (static_cast<Compression>(type)) {
        case Compression::None: {
            return c.read_byte_vector(length);
        }
        case Compression::Gzip: {
            uint32_t uncompressed = c.read_u32();
            return gunzip(c.read_bytes(length), uncompressed);
        }
        case Compression::Bzip2:
            throw UnsupportedCompression("js5: bzip2 containers are not supported");
        case Compression::Lzma:
            throw UnsupportedCompression("js5: lzma containers are not supported");
        }
        throw MalformedRecord(std::format("js5: unknown compression type {}", type));
    } catch (const OutOfBounds& e) {
        throw MalformedRecord(std::format("js5: truncated container: {}", e.what()));
    }
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------

int32_t name_hash(std::string_view name) {
    uint32_t h = 0;
    for (char ch : name) {
        auto c = static_cast<unsigned char>(std::tolower(static_cast<unsigned char>(ch)));
        h = h * 31 + c;
    }
    return static_cast<int32_t>(h);
}

// ---------------------------------------------------------------------------
// Reference tables
// ---------------------------------------------------------------------------

const GroupEntry* ReferenceTable::find(uint32_t group_id) const {
    auto it = groups.find(group_id);
    return it == groups.end() ? nullptr : &it->second;
}

const GroupEntry* ReferenceTable::find_by_name(std::string_view name) const {
    return find_by_name_hash(name_hash(name));
}

const GroupEntry* ReferenceTable::find_by_name_hash(int32_t hash) const {
    auto it = name_index.find(hash);
    return it == name_index.end() ? nullptr : find(it->second);
}

ReferenceTable read_reference_table(std::span<const uint8_t> data) {
    ReferenceTable t;
    try {
        ByteCursor c(data);
        t.protocol = c.read_u8();
        if (t.protocol < 5 || t.protocol > 7)
            throw MalformedRecord(std::format("js5: unsupported reference table protocol {}", t.protocol));

        if (t.protocol >= 6) t.version = c.read_i32();
        t.flags = c.read_u8();
        bool named = (t.flags & table_flags::kNames) != 0;

        auto read_count = [&]() -> uint32_t {
            return t.protocol >= 7 ? c.read_big_smart() : c.read_u16();
        };

        uint32_t count = read_count();
        if (count > c.remaining())
            throw MalformedRecord(std::format("js5: group count {} exceeds table size", count));

        std::vector<uint32_t> ids(count);
        uint32_t id = 0;
        for (auto& v : ids) {
            id += read_count();
            v = id;
        }

        std::vector<GroupEntry> entries(count);
        for (size_t i = 0; i < count; i++) entries[i].id = ids[i];

        if (named) {
            for (auto& e : entries) {
                e.name_hash = c.read_i32();
                e.named = true;
            }
        }
        for (auto& e : entries) e.checksum = c.read_i32();
        if (t.flags & table_flags::kUncompressedChecksums) {
            for (auto& e : entries) e.uncompressed_checksum = c.read_i32();
        }
        if (t.flags & table_flags::kDigests) {
            for (auto& e : entries) {
                auto d = c.read_bytes(e.digest.size());
                std::copy(d.begin(), d.end(), e.digest.begin());
            }
        }
        if (t.flags & table_flags::kLengths) {
            for (auto& e : entries) {
                e.length = c.read_u32();
                e.uncompressed_length = c.read_u32();
            }
        }
        for (auto& e : entries) e.version = c.read_i32();

        std::vector<uint32_t> file_counts(count);
        for (auto& n : file_counts) n = read_count();

        for (size_t i = 0; i < count; i++) {
            if (file_counts[i] > c.remaining())
                throw MalformedRecord(std::format(
                    "js5: group {} claims {} files, table too short", entries[i].id, file_counts[i]));
            entries[i].file_ids.resize(file_counts[i]);
            uint32_t fid = 0;
            for (auto& f : entries[i].file_ids) {
                fid += read_count();
                f = fid;
            }
        }

        if (named) {
            for (size_t i = 0; i < count; i++) {
                entries[i].file_name_hashes.resize(file_counts[i]);
                for (auto& h : entries[i].file_name_hashes) h = c.read_i32();
            }
        }

        for (auto& e : entries) {
            if (e.named) t.name_index.emplace(e.name_hash, e.id);
            uint32_t gid = e.id;
            if (!t.groups.emplace(gid, std::move(e)).second)
                throw MalformedRecord(std::format("js5: duplicate group id {}", gid));
        }
    } catch (const OutOfBounds& e) {
        throw MalformedRecord(std::format("js5: truncated reference table: {}", e.what()));
    }
    return t;
}

// ---------------------------------------------------------------------------
// Groups
// ---------------------------------------------------------------------------

std::vector<std::vector<uint8_t>> split_group(std::span<const uint8_t> data, size_t file_count) {
    std::vector<std::vector<uint8_t>> files;
    if (file_count == 0) return files;
    if (file_count == 1) {
        files.emplace_back(data.begin(), data.end());
        return files;
    }

    if (data.empty())
        throw MalformedRecord("js5: empty group with multiple files");

    size_t chunks = data.back();
    size_t table_size = chunks * file_count * 4;
    if (table_size + 1 > data.size())
        throw MalformedRecord(std::format(
            "js5: group size table ({} chunks x {} files) exceeds {} bytes",
            chunks, file_count, data.size()));

    size_t payload_size = data.size() - 1 - table_size;
    ByteCursor sizes(data.subspan(payload_size, table_size));

    std::vector<std::vector<size_t>> chunk_sizes(chunks, std::vector<size_t>(file_count));
    size_t total = 0;
    for (size_t ch = 0; ch < chunks; ch++) {
        int64_t running = 0;
        for (size_t f = 0; f < file_count; f++) {
            running += sizes.read_i32();
            if (running < 0)
                throw MalformedRecord(std::format(
                    "js5: negative size for file {} in chunk {}", f, ch));
            if (static_cast<uint64_t>(running) > payload_size)
                throw MalformedRecord(std::format(
                    "js5: file {} in chunk {} needs {} bytes, only {} present",
                    f, ch, running, payload_size));
            chunk_sizes[ch][f] = static_cast<size_t>(running);
            total += static_cast<size_t>(running);
        }
    }
    if (total > payload_size)
        throw MalformedRecord(std::format(
            "js5: group files need {} bytes, only {} present", total, payload_size));

    files.resize(file_count);
    size_t offset = 0;
    for (size_t ch = 0; ch < chunks; ch++) {
        for (size_t f = 0; f < file_count; f++) {
            size_t n = chunk_sizes[ch][f];
            files[f].insert(files[f].end(), data.begin() + static_cast<ptrdiff_t>(offset),
                            data.begin() + static_cast<ptrdiff_t>(offset + n));
            offset += n;
        }
    }
    return files;
}

} // namespace rstools::js5
