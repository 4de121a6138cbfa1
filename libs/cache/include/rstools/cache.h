#pragma once

#include "rstools/js5.h"

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rstools::cache {

// CacheError reports a storage failure (unreadable files, broken sector
// chains, undecodable containers). A missing archive is not an error.
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ArchiveKey {
    uint32_t index = 0;
    uint32_t archive = 0;

    auto operator<=>(const ArchiveKey&) const = default;
};

// CacheSource fetches decompressed, decrypted archive bytes by key.
// Implementations must be safe to call from several threads at once, and
// the returned bytes belong to the caller.
class CacheSource {
public:
    virtual ~CacheSource() = default;

    // fetch returns std::nullopt when the archive does not exist.
    virtual std::optional<std::vector<uint8_t>> fetch(uint32_t index, uint32_t archive) const = 0;

    std::optional<std::vector<uint8_t>> fetch(const ArchiveKey& key) const {
        return fetch(key.index, key.archive);
    }
};

// load_reference_table fetches and parses the reference table of an index.
// Throws CacheError when the table is missing or unreadable.
js5::ReferenceTable load_reference_table(const CacheSource& source, uint32_t index);

// MemorySource serves archives held in memory. It is filled before use and
// read-only afterwards.
class MemorySource : public CacheSource {
public:
    void put(uint32_t index, uint32_t archive, std::vector<uint8_t> data);
    size_t size() const { return archives_.size(); }

    std::optional<std::vector<uint8_t>> fetch(uint32_t index, uint32_t archive) const override;
    using CacheSource::fetch;

private:
    std::map<ArchiveKey, std::vector<uint8_t>> archives_;
};

// Keyring maps (index, archive) to the XTEA key the archive is encrypted with.
class Keyring {
public:
    void add(uint32_t index, uint32_t archive, const js5::XteaKey& key);
    const js5::XteaKey* find(uint32_t index, uint32_t archive) const;
    size_t size() const { return keys_.size(); }

private:
    std::map<ArchiveKey, js5::XteaKey> keys_;
};

// load_xtea_keys reads a JSON array of
//   { "archive": 5, "group": 1234, "key": [k0, k1, k2, k3] }
// objects. "archive" defaults to the map index.
Keyring load_xtea_keys(const std::string& path);

// Dat2Source reads the flat-file cache layout: main_file_cache.dat2 plus one
// main_file_cache.idx<N> file per index.
class Dat2Source : public CacheSource {
public:
    explicit Dat2Source(const std::string& dir, Keyring keys = {});
    ~Dat2Source() override;
    Dat2Source(Dat2Source&&) noexcept;
    Dat2Source& operator=(Dat2Source&&) noexcept;

    const std::string& dir() const;

    // read_raw returns the stored (still compressed) container bytes.
    std::optional<std::vector<uint8_t>> read_raw(uint32_t index, uint32_t archive) const;

    std::optional<std::vector<uint8_t>> fetch(uint32_t index, uint32_t archive) const override;
    using CacheSource::fetch;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Sector layout constants of the dat2 file.
constexpr size_t kSectorSize = 520;
constexpr size_t kSectorHeaderSize = 8;
constexpr size_t kExtendedSectorHeaderSize = 10;
constexpr size_t kIndexEntrySize = 6;

} // namespace rstools::cache
