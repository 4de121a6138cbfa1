#pragma once

#include "rstools/cache.h"
#include "rstools/locconfig.h"
#include "rstools/mapsquare.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rstools::locindex {

// LocationRow is a location config as stored in the database.
struct LocationRow {
    uint32_t id = 0;
    std::string name; // empty for unnamed locations
    std::vector<uint32_t> models;
};

// DBStats contains aggregate database statistics.
struct DBStats {
    std::string schema_version;
    std::string created_at;
    std::string cache_dir;
    int location_count = 0;
    int placement_count = 0;
    int squares_ok = 0;
    int squares_absent = 0;
    int squares_malformed = 0;
};

// BuildProgress reports the current state of a build.
struct BuildProgress {
    std::string phase; // "configs", "squares", "commit"
    size_t square_index = 0;
    size_t square_total = 0;
    uint32_t i = 0;
    uint32_t j = 0;
};

using BuildProgressFunc = std::function<void(const BuildProgress&)>;

struct BuildOptions {
    mapsquare::GridExtent extent;
    locconfig::Options config;
    std::string cache_dir; // recorded in meta only
};

struct BuildResult {
    int location_count = 0;
    int placement_count = 0;
    int squares_ok = 0;
    int squares_absent = 0;
    int squares_malformed = 0;
};

// DB wraps a SQLite database of location configs and their placements.
class DB {
public:
    ~DB();
    DB(DB&& other) noexcept;
    DB& operator=(DB&& other) noexcept;

    // build_db decodes every location config and every map square of the
    // source into a new database at db_path. Malformed squares are recorded
    // and skipped.
    static BuildResult build_db(const std::string& db_path,
                                const cache::CacheSource& source,
                                const BuildOptions& opts = {},
                                BuildProgressFunc progress = nullptr);

    // open opens an existing database read-only.
    static DB open(const std::string& path);

    DBStats stats() const;

    // find_placements returns every placement of a location id, ordered by
    // square and record order.
    std::vector<mapsquare::Placement> find_placements(uint32_t loc_id) const;

    // find_locations matches names with SQL LIKE (case-insensitive, % and _
    // wildcards).
    std::vector<LocationRow> find_locations(const std::string& name_pattern) const;

    std::optional<LocationRow> location(uint32_t id) const;

private:
    DB();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace rstools::locindex
