#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace rstools::js5 {

// Well-known index ids.
constexpr uint32_t kConfigIndex = 2;
constexpr uint32_t kMapIndex = 5;
constexpr uint32_t kReferenceIndex = 255;

// Group of kConfigIndex holding one file per location config.
constexpr uint32_t kLocationConfigGroup = 6;

enum class Compression : uint8_t { None = 0, Bzip2 = 1, Gzip = 2, Lzma = 3 };

// UnsupportedCompression is thrown for containers this build cannot unpack.
class UnsupportedCompression : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct XteaKey {
    std::array<int32_t, 4> k{};

    bool is_zero() const { return k[0] == 0 && k[1] == 0 && k[2] == 0 && k[3] == 0; }
};

// xtea_decrypt decrypts data in place. Trailing bytes that do not fill an
// 8-byte block are left untouched.
void xtea_decrypt(std::span<uint8_t> data, const XteaKey& key);

// decompress unpacks a container (type, lengths, payload, optional version
// trailer) into the stored file bytes. When key is non-null and non-zero the
// container body is XTEA-decrypted first.
std::vector<uint8_t> decompress(std::span<const uint8_t> container, const XteaKey* key = nullptr);

// name_hash is the cache's group name hash (Java String.hashCode of the
// lower-cased name).
int32_t name_hash(std::string_view name);

struct GroupEntry {
    uint32_t id = 0;
    int32_t name_hash = 0;
    bool named = false;
    int32_t checksum = 0;
    int32_t uncompressed_checksum = 0;
    std::array<uint8_t, 64> digest{};
    uint32_t length = 0;
    uint32_t uncompressed_length = 0;
    int32_t version = 0;
    std::vector<uint32_t> file_ids;
    std::vector<int32_t> file_name_hashes; // empty unless the table is named
};

// ReferenceTable lists the groups of one index (stored as archive <index>
// of index 255).
struct ReferenceTable {
    uint8_t protocol = 0;
    int32_t version = 0;
    uint8_t flags = 0;
    std::map<uint32_t, GroupEntry> groups;
    std::unordered_map<int32_t, uint32_t> name_index; // name hash -> group id

    const GroupEntry* find(uint32_t group_id) const;
    const GroupEntry* find_by_name(std::string_view name) const;
    const GroupEntry* find_by_name_hash(int32_t hash) const;
};

namespace table_flags {
constexpr uint8_t kNames = 0x1;
constexpr uint8_t kDigests = 0x2;
constexpr uint8_t kLengths = 0x4;
constexpr uint8_t kUncompressedChecksums = 0x8;
} // namespace table_flags

// read_reference_table parses decompressed reference table bytes.
// Throws binutil::MalformedRecord on truncated or unsupported data.
ReferenceTable read_reference_table(std::span<const uint8_t> data);

// split_group splits decompressed group bytes into file_count files, in the
// order of the group's file ids.
std::vector<std::vector<uint8_t>> split_group(std::span<const uint8_t> data, size_t file_count);

} // namespace rstools::js5
