#include "rstools/cache.h"
#include "rstools/js5.h"

#include "fixtures/cache_fixture.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace rstools;
using namespace rstools::cache;
using rstools::fixture::ByteWriter;

namespace {

fs::path unique_test_root() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    const auto base = fs::temp_directory_path() / "rstools-cache-tests";
    const auto unique = base / (std::string(info->name()) + "-" +
                                std::to_string(static_cast<unsigned long long>(std::rand())));
    fs::create_directories(unique);
    return unique;
}

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    ASSERT_TRUE(out.is_open());
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

void write_text_file(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    ASSERT_TRUE(out.is_open());
    out << text;
}

std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Dat2Writer lays archives out in the flat-file format: consecutive 520-byte
// sectors in main_file_cache.dat2, 6-byte entries in main_file_cache.idx<N>.
class Dat2Writer {
public:
    Dat2Writer() : dat_(kSectorSize, 0) {} // sector 0 is never used

    // Returns the first sector of the archive.
    uint32_t put(uint32_t index, uint32_t archive, const std::vector<uint8_t>& data) {
        bool extended = archive > 0xFFFF;
        size_t header = extended ? kExtendedSectorHeaderSize : kSectorHeaderSize;
        size_t per_sector = kSectorSize - header;
        size_t sectors = std::max<size_t>(1, (data.size() + per_sector - 1) / per_sector);
        auto first = static_cast<uint32_t>(dat_.size() / kSectorSize);

        for (size_t c = 0; c < sectors; c++) {
            uint32_t sector = first + static_cast<uint32_t>(c);
            uint32_t next = c + 1 < sectors ? sector + 1 : 0;
            ByteWriter h;
            if (extended) h.u32(archive);
            else h.u16(archive);
            h.u16(static_cast<uint32_t>(c)).u24(next).u8(index);

            size_t begin = c * per_sector;
            size_t end = std::min(data.size(), begin + per_sector);
            std::vector<uint8_t> block = h.data();
            block.insert(block.end(), data.begin() + static_cast<ptrdiff_t>(begin),
                         data.begin() + static_cast<ptrdiff_t>(end));
            block.resize(kSectorSize, 0);
            dat_.insert(dat_.end(), block.begin(), block.end());
        }

        auto& idx = idx_[index];
        size_t off = static_cast<size_t>(archive) * kIndexEntrySize;
        if (idx.size() < off + kIndexEntrySize) idx.resize(off + kIndexEntrySize, 0);
        ByteWriter e;
        e.u24(static_cast<uint32_t>(data.size())).u24(first);
        std::copy(e.data().begin(), e.data().end(), idx.begin() + static_cast<ptrdiff_t>(off));
        return first;
    }

    std::vector<uint8_t>& dat() { return dat_; }

    void write(const fs::path& dir) const {
        write_file(dir / "main_file_cache.dat2", dat_);
        for (const auto& [index, data] : idx_) {
            write_file(dir / ("main_file_cache.idx" + std::to_string(index)), data);
        }
    }

private:
    std::vector<uint8_t> dat_;
    std::map<uint32_t, std::vector<uint8_t>> idx_;
};

} // namespace

// ---------------------------------------------------------------------------
// MemorySource
// ---------------------------------------------------------------------------

TEST(Cache, MemorySourceFetch) {
    MemorySource src;
    src.put(2, 6, bytes_of("configs"));
    EXPECT_EQ(src.size(), 1u);

    auto data = src.fetch(2, 6);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, bytes_of("configs"));

    EXPECT_FALSE(src.fetch(2, 7).has_value());
    EXPECT_FALSE(src.fetch(ArchiveKey{3, 6}).has_value());
    EXPECT_TRUE(src.fetch(ArchiveKey{2, 6}).has_value());
}

TEST(Cache, LoadReferenceTable) {
    MemorySource src;
    src.put(js5::kReferenceIndex, js5::kMapIndex,
            fixture::reference_table({{0, "l1_2", {0}}, {1, "m1_2", {0}}}));

    auto table = load_reference_table(src, js5::kMapIndex);
    EXPECT_EQ(table.groups.size(), 2u);
    ASSERT_NE(table.find_by_name("l1_2"), nullptr);
    EXPECT_EQ(table.find_by_name("l1_2")->id, 0u);

    EXPECT_THROW(load_reference_table(src, js5::kConfigIndex), CacheError);

    src.put(js5::kReferenceIndex, 9, {1, 2, 3});
    EXPECT_THROW(load_reference_table(src, 9), CacheError);
}

// ---------------------------------------------------------------------------
// Keys
// ---------------------------------------------------------------------------

TEST(Cache, Keyring) {
    Keyring ring;
    ring.add(5, 100, js5::XteaKey{{1, 2, 3, 4}});
    ASSERT_NE(ring.find(5, 100), nullptr);
    EXPECT_EQ(ring.find(5, 100)->k[2], 3);
    EXPECT_EQ(ring.find(5, 101), nullptr);
    EXPECT_EQ(ring.size(), 1u);
}

TEST(Cache, LoadXteaKeys) {
    auto dir = unique_test_root();
    auto path = dir / "keys.json";
    write_text_file(path, R"([
        {"group": 12, "key": [1, -2, 3, 2147483647]},
        {"archive": 7, "group": 3, "key": [0, 0, 0, 9]}
    ])");

    auto ring = load_xtea_keys(path.string());
    EXPECT_EQ(ring.size(), 2u);
    ASSERT_NE(ring.find(js5::kMapIndex, 12), nullptr);
    EXPECT_EQ(ring.find(js5::kMapIndex, 12)->k[1], -2);
    EXPECT_EQ(ring.find(js5::kMapIndex, 12)->k[3], 2147483647);
    ASSERT_NE(ring.find(7, 3), nullptr);

    fs::remove_all(dir);
}

TEST(Cache, LoadXteaKeysErrors) {
    auto dir = unique_test_root();

    EXPECT_THROW(load_xtea_keys((dir / "missing.json").string()), CacheError);

    write_text_file(dir / "object.json", R"({"group": 1})");
    EXPECT_THROW(load_xtea_keys((dir / "object.json").string()), CacheError);

    write_text_file(dir / "short.json", R"([{"group": 1, "key": [1, 2, 3]}])");
    EXPECT_THROW(load_xtea_keys((dir / "short.json").string()), CacheError);

    write_text_file(dir / "broken.json", "[{");
    EXPECT_THROW(load_xtea_keys((dir / "broken.json").string()), CacheError);

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Dat2Source
// ---------------------------------------------------------------------------

TEST(Cache, Dat2ReadsArchives) {
    auto dir = unique_test_root();

    std::string big(1500, 'q');
    for (size_t i = 0; i < big.size(); i++) big[i] = static_cast<char>('a' + i % 26);

    Dat2Writer w;
    w.put(2, 6, fixture::container_gzip(bytes_of("small archive")));
    w.put(5, 3, fixture::container_none(bytes_of(big)));
    w.write(dir);

    Dat2Source src(dir.string());
    EXPECT_EQ(src.dir(), dir.string());

    auto small = src.fetch(2, 6);
    ASSERT_TRUE(small.has_value());
    EXPECT_EQ(*small, bytes_of("small archive"));

    // Spans three sectors.
    auto large = src.fetch(5, 3);
    ASSERT_TRUE(large.has_value());
    EXPECT_EQ(*large, bytes_of(big));

    auto raw = src.read_raw(5, 3);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->size(), big.size() + 5);

    fs::remove_all(dir);
}

TEST(Cache, Dat2NotFound) {
    auto dir = unique_test_root();
    Dat2Writer w;
    w.put(5, 2, fixture::container_none(bytes_of("x")));
    w.write(dir);

    Dat2Source src(dir.string());
    EXPECT_FALSE(src.fetch(5, 0).has_value());  // zero entry
    EXPECT_FALSE(src.fetch(5, 40).has_value()); // past the end of the index
    EXPECT_FALSE(src.fetch(8, 0).has_value());  // no index file
    EXPECT_TRUE(src.fetch(5, 2).has_value());

    fs::remove_all(dir);
}

TEST(Cache, Dat2MissingDirectory) {
    auto dir = unique_test_root();
    EXPECT_THROW(Dat2Source((dir / "nope").string()), CacheError);
    fs::remove_all(dir);
}

TEST(Cache, Dat2BrokenSectorChain) {
    auto dir = unique_test_root();
    Dat2Writer w;
    uint32_t first = w.put(5, 4, fixture::container_none(std::vector<uint8_t>(1200, 7)));
    // Second sector claims to belong to archive 99.
    size_t second = (first + 1) * kSectorSize;
    w.dat()[second] = 0;
    w.dat()[second + 1] = 99;
    w.write(dir);

    Dat2Source src(dir.string());
    EXPECT_THROW(src.fetch(5, 4), CacheError);

    fs::remove_all(dir);
}

TEST(Cache, Dat2ExtendedSectorHeaders) {
    auto dir = unique_test_root();
    Dat2Writer w;
    std::vector<uint8_t> payload(700, 0x5A);
    w.put(5, 70000, fixture::container_none(payload));
    w.write(dir);

    Dat2Source src(dir.string());
    auto data = src.fetch(5, 70000);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, payload);

    fs::remove_all(dir);
}

TEST(Cache, Dat2DecryptsWithKeyring) {
    auto dir = unique_test_root();
    js5::XteaKey key{{-1, 2, -3, 4}};
    auto payload = bytes_of("locations for a keyed square");
    auto container = fixture::container_gzip(payload);
    fixture::xtea_encrypt(container, key);

    Dat2Writer w;
    w.put(5, 11, container);
    w.write(dir);

    Keyring keys;
    keys.add(5, 11, key);
    Dat2Source keyed(dir.string(), keys);
    auto data = keyed.fetch(5, 11);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, payload);

    // Without the key the payload does not inflate.
    Dat2Source plain(dir.string());
    EXPECT_THROW(plain.fetch(5, 11), CacheError);

    fs::remove_all(dir);
}

TEST(Cache, Dat2DecryptsArchivesWithVersionTrailer) {
    auto dir = unique_test_root();
    js5::XteaKey key{{7, -8, 9, -10}};

    // Encrypted bodies of 6 and 7 bytes, then a body of 15.
    std::vector<std::vector<uint8_t>> payloads = {
        bytes_of("sixsix"), bytes_of("sevenis"), bytes_of("fifteen bytes!!"),
    };
    Dat2Writer w;
    Keyring keys;
    for (uint32_t a = 0; a < payloads.size(); a++) {
        auto container = fixture::container_none(payloads[a]);
        fixture::xtea_encrypt(container, key);
        w.put(5, 20 + a, fixture::with_version(container, 3));
        keys.add(5, 20 + a, key);
    }
    auto gz = fixture::container_gzip(bytes_of("a gzip body behind a version trailer"));
    fixture::xtea_encrypt(gz, key);
    w.put(5, 30, fixture::with_version(gz, 3));
    keys.add(5, 30, key);
    w.write(dir);

    Dat2Source src(dir.string(), keys);
    for (uint32_t a = 0; a < payloads.size(); a++) {
        auto data = src.fetch(5, 20 + a);
        ASSERT_TRUE(data.has_value());
        EXPECT_EQ(*data, payloads[a]);
    }
    auto data = src.fetch(5, 30);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, bytes_of("a gzip body behind a version trailer"));

    fs::remove_all(dir);
}

TEST(Cache, Dat2WrapsUnsupportedCompression) {
    auto dir = unique_test_root();
    ByteWriter bz;
    bz.u8(1).u32(4).u32(10).u32(0);
    Dat2Writer w;
    w.put(2, 1, bz.data());
    w.write(dir);

    Dat2Source src(dir.string());
    EXPECT_THROW(src.fetch(2, 1), CacheError);

    fs::remove_all(dir);
}

TEST(Cache, Dat2ConcurrentFetches) {
    auto dir = unique_test_root();
    Dat2Writer w;
    std::vector<std::vector<uint8_t>> payloads;
    for (uint32_t a = 0; a < 16; a++) {
        payloads.emplace_back(600 + a * 37, static_cast<uint8_t>(a));
        w.put(5, a, fixture::container_none(payloads.back()));
    }
    w.write(dir);

    Dat2Source src(dir.string());
    std::vector<int> mismatches(4, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (int round = 0; round < 20; round++) {
                for (uint32_t a = 0; a < 16; a++) {
                    auto data = src.fetch(5, (a + static_cast<uint32_t>(t)) % 16);
                    if (!data || *data != payloads[(a + static_cast<uint32_t>(t)) % 16]) mismatches[t]++;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int m : mismatches) EXPECT_EQ(m, 0);

    fs::remove_all(dir);
}
