#include "rstools/cache.h"
#include "rstools/binutil.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

namespace fs = std::filesystem;

namespace rstools::cache {

js5::ReferenceTable load_reference_table(const CacheSource& source, uint32_t index) {
    auto data = source.fetch(js5::kReferenceIndex, index);
    if (!data)
        throw CacheError(std::format("cache: reference table for index {} not found", index));
    try {
        return js5::read_reference_table(*data);
    } catch (const binutil::DecodeError& e) {
        throw CacheError(std::format("cache: reference table for index {}: {}", index, e.what()));
    }
}

// ---------------------------------------------------------------------------
// MemorySource
// ---------------------------------------------------------------------------

void MemorySource::put(uint32_t index, uint32_t archive, std::vector<uint8_t> data) {
    archives_[ArchiveKey{index, archive}] = std::move(data);
}

std::optional<std::vector<uint8_t>> MemorySource::fetch(uint32_t index, uint32_t archive) const {
    auto it = archives_.find(ArchiveKey{index, archive});
    if (it == archives_.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Keyring
// ---------------------------------------------------------------------------

void Keyring::add(uint32_t index, uint32_t archive, const js5::XteaKey& key) {
    keys_[ArchiveKey{index, archive}] = key;
}

const js5::XteaKey* Keyring::find(uint32_t index, uint32_t archive) const {
    auto it = keys_.find(ArchiveKey{index, archive});
    return it == keys_.end() ? nullptr : &it->second;
}

Keyring load_xtea_keys(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw CacheError("cache: reading keys " + path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::exception& e) {
        throw CacheError(std::format("cache: parsing keys {}: {}", path, e.what()));
    }
    if (!j.is_array())
        throw CacheError(std::format("cache: keys {} must be a JSON array", path));

    Keyring ring;
    for (const auto& entry : j) {
        if (!entry.contains("group") || !entry.contains("key"))
            throw CacheError(std::format("cache: keys {}: entry without group/key: {}", path, entry.dump()));
        const auto& key = entry["key"];
        if (!key.is_array() || key.size() != 4)
            throw CacheError(std::format("cache: keys {}: key must have 4 integers: {}", path, entry.dump()));

        js5::XteaKey k;
        for (size_t i = 0; i < 4; i++) k.k[i] = key[i].get<int32_t>();
        uint32_t archive = entry.value("archive", js5::kMapIndex);
        ring.add(archive, entry["group"].get<uint32_t>(), k);
    }
    return ring;
}

// ---------------------------------------------------------------------------
// Dat2Source
// ---------------------------------------------------------------------------

struct Dat2Source::Impl {
    std::string dir;
    Keyring keys;
    std::mutex mu;
    std::ifstream dat;
    uint64_t dat_size = 0;
    std::map<uint32_t, std::unique_ptr<std::ifstream>> idx;

    // Returns nullptr when the index file does not exist. Caller holds mu.
    std::ifstream* index_file(uint32_t index) {
        auto it = idx.find(index);
        if (it != idx.end()) return it->second.get();

        auto path = fs::path(dir) / std::format("main_file_cache.idx{}", index);
        std::unique_ptr<std::ifstream> f;
        if (fs::exists(path)) {
            f = std::make_unique<std::ifstream>(path, std::ios::binary);
            if (!*f) throw CacheError("cache: cannot open " + path.string());
        }
        auto* raw = f.get();
        idx.emplace(index, std::move(f));
        return raw;
    }
};

static uint32_t be24(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 16) | (static_cast<uint32_t>(p[1]) << 8) | p[2];
}

Dat2Source::Dat2Source(const std::string& dir, Keyring keys) : impl_(std::make_unique<Impl>()) {
    impl_->dir = dir;
    impl_->keys = std::move(keys);

    auto path = fs::path(dir) / "main_file_cache.dat2";
    impl_->dat.open(path, std::ios::binary);
    if (!impl_->dat) throw CacheError("cache: cannot open " + path.string());
    std::error_code ec;
    impl_->dat_size = fs::file_size(path, ec);
    if (ec) throw CacheError(std::format("cache: stat {}: {}", path.string(), ec.message()));
}

Dat2Source::~Dat2Source() = default;
Dat2Source::Dat2Source(Dat2Source&&) noexcept = default;
Dat2Source& Dat2Source::operator=(Dat2Source&&) noexcept = default;

const std::string& Dat2Source::dir() const { return impl_->dir; }

std::optional<std::vector<uint8_t>> Dat2Source::read_raw(uint32_t index, uint32_t archive) const {
    std::lock_guard<std::mutex> lock(impl_->mu);

    auto* idx = impl_->index_file(index);
    if (!idx) return std::nullopt;

    idx->clear();
    idx->seekg(static_cast<std::streamoff>(archive) * kIndexEntrySize);
    uint8_t entry[kIndexEntrySize];
    if (!idx->read(reinterpret_cast<char*>(entry), kIndexEntrySize)) {
        idx->clear();
        return std::nullopt;
    }

    uint32_t size = be24(entry);
    uint32_t sector = be24(entry + 3);
    if (size == 0 || sector == 0) return std::nullopt;

    bool extended = archive > 0xFFFF;
    size_t header_size = extended ? kExtendedSectorHeaderSize : kSectorHeaderSize;
    size_t data_per_sector = kSectorSize - header_size;

    std::vector<uint8_t> out;
    out.reserve(size);
    uint8_t buf[kSectorSize];
    uint16_t chunk = 0;

    auto& dat = impl_->dat;
    while (out.size() < size) {
        if (sector == 0 || static_cast<uint64_t>(sector) * kSectorSize >= impl_->dat_size)
            throw CacheError(std::format(
                "cache: archive {}/{} points to invalid sector {}", index, archive, sector));

        size_t want = std::min<size_t>(size - out.size(), data_per_sector);
        dat.clear();
        dat.seekg(static_cast<std::streamoff>(sector) * kSectorSize);
        if (!dat.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(header_size + want)))
            throw CacheError(std::format(
                "cache: short read of sector {} for archive {}/{}", sector, index, archive));

        binutil::ByteCursor h(buf, header_size);
        uint32_t sector_archive = extended ? h.read_u32() : h.read_u16();
        uint16_t sector_chunk = h.read_u16();
        uint32_t next = h.read_u24();
        uint8_t sector_index = h.read_u8();

        if (sector_archive != archive || sector_chunk != chunk || sector_index != (index & 0xFF))
            throw CacheError(std::format(
                "cache: sector {} belongs to {}/{} chunk {}, expected {}/{} chunk {}",
                sector, sector_index, sector_archive, sector_chunk, index, archive, chunk));

        out.insert(out.end(), buf + header_size, buf + header_size + want);
        sector = next;
        chunk++;
    }
    return out;
}

std::optional<std::vector<uint8_t>> Dat2Source::fetch(uint32_t index, uint32_t archive) const {
    auto raw = read_raw(index, archive);
    if (!raw) return std::nullopt;

    const js5::XteaKey* key = impl_->keys.find(index, archive);
    try {
        return js5::decompress(*raw, key);
    } catch (const js5::UnsupportedCompression& e) {
        throw CacheError(std::format("cache: archive {}/{}: {}", index, archive, e.what()));
    } catch (const binutil::DecodeError& e) {
        throw CacheError(std::format("cache: archive {}/{}: {}", index, archive, e.what()));
    }
}

} // namespace rstools::cache
