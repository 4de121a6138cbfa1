#include "rstools/locindex.h"
#include "rstools/binutil.h"

#include <sqlite3.h>

#include <charconv>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <stdexcept>

namespace fs = std::filesystem;

namespace rstools::locindex {

static bool gmtime_utc(std::time_t tt, std::tm& tm_val) {
#if defined(_WIN32)
    return gmtime_s(&tm_val, &tt) == 0;
#else
    return gmtime_r(&tt, &tm_val) != nullptr;
#endif
}

// ---------------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------------

static constexpr const char* schema_sql = R"SQL(
CREATE TABLE meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE locations (
    id INTEGER PRIMARY KEY,
    name TEXT NOT NULL DEFAULT '',
    models TEXT NOT NULL DEFAULT ''
);
CREATE TABLE squares (
    i INTEGER NOT NULL,
    j INTEGER NOT NULL,
    status TEXT NOT NULL,
    message TEXT NOT NULL DEFAULT '',
    PRIMARY KEY (i, j)
);
CREATE TABLE placements (
    loc_id INTEGER NOT NULL,
    square_i INTEGER NOT NULL,
    square_j INTEGER NOT NULL,
    seq INTEGER NOT NULL,
    plane INTEGER NOT NULL,
    x INTEGER NOT NULL,
    y INTEGER NOT NULL,
    type INTEGER NOT NULL,
    orientation INTEGER NOT NULL
);
CREATE INDEX idx_placements_loc ON placements(loc_id);
CREATE INDEX idx_locations_name ON locations(name);
)SQL";

static constexpr const char* schema_version = "1";

// ---------------------------------------------------------------------------
// SQLite helpers
// ---------------------------------------------------------------------------

class SqliteStmt {
public:
    SqliteStmt(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK)
            throw std::runtime_error(
                std::format("sqlite3_prepare_v2: {}", sqlite3_errmsg(db)));
    }
    ~SqliteStmt() { if (stmt_) sqlite3_finalize(stmt_); }
    SqliteStmt(const SqliteStmt&) = delete;
    SqliteStmt& operator=(const SqliteStmt&) = delete;

    sqlite3_stmt* get() const { return stmt_; }

    void reset() { sqlite3_reset(stmt_); sqlite3_clear_bindings(stmt_); }

    void bind_text(int idx, const std::string& v) {
        sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    void bind_int(int idx, int v) { sqlite3_bind_int(stmt_, idx, v); }
    void bind_int64(int idx, int64_t v) { sqlite3_bind_int64(stmt_, idx, v); }

    int step() { return sqlite3_step(stmt_); }

    void exec() {
        int rc = step();
        if (rc != SQLITE_DONE && rc != SQLITE_ROW)
            throw std::runtime_error(
                std::format("sqlite3_step: {}", sqlite3_errmsg(sqlite3_db_handle(stmt_))));
    }

    std::string column_text(int col) const {
        const char* v = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
        return v ? v : "";
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error(std::format("sqlite3_exec: {}", msg));
    }
}

static sqlite3* open_db_handle(const std::string& path, int flags) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error(std::format("sqlite3_open_v2({}): {}", path, msg));
    }
    return db;
}

static bool table_exists(sqlite3* db, const char* table) {
    SqliteStmt stmt(db,
        "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?1");
    stmt.bind_text(1, table);
    return stmt.step() == SQLITE_ROW;
}

// Models are stored as a comma separated id list.
static std::string join_models(const std::vector<uint32_t>& models) {
    std::string out;
    for (size_t i = 0; i < models.size(); ++i) {
        if (i > 0) out += ',';
        out += std::to_string(models[i]);
    }
    return out;
}

static std::vector<uint32_t> split_models(const std::string& s) {
    std::vector<uint32_t> out;
    const char* p = s.data();
    const char* end = s.data() + s.size();
    while (p < end) {
        uint32_t v = 0;
        auto [next, ec] = std::from_chars(p, end, v);
        if (ec != std::errc())
            throw std::runtime_error(std::format("locindex: bad model list '{}'", s));
        out.push_back(v);
        p = next;
        if (p < end && *p == ',') ++p;
    }
    return out;
}

static LocationRow read_location_row(const SqliteStmt& stmt) {
    LocationRow row;
    row.id = static_cast<uint32_t>(sqlite3_column_int64(stmt.get(), 0));
    row.name = stmt.column_text(1);
    row.models = split_models(stmt.column_text(2));
    return row;
}

// ---------------------------------------------------------------------------
// DB
// ---------------------------------------------------------------------------

struct DB::Impl {
    sqlite3* db = nullptr;

    ~Impl() {
        if (db) sqlite3_close(db);
    }
};

DB::DB() : impl_(std::make_unique<Impl>()) {}

DB::~DB() = default;

DB::DB(DB&& other) noexcept = default;
DB& DB::operator=(DB&& other) noexcept = default;

// ---------------------------------------------------------------------------
// DB::build_db
// ---------------------------------------------------------------------------

static void index_configs(sqlite3* db, const locconfig::LocationConfigTable& configs,
                          BuildResult& result) {
    SqliteStmt stmt(db, "INSERT INTO locations (id, name, models) VALUES (?1, ?2, ?3)");
    for (const auto& [id, loc] : configs) {
        stmt.reset();
        stmt.bind_int64(1, id);
        stmt.bind_text(2, loc.name.value_or(""));
        stmt.bind_text(3, join_models(loc.models));
        stmt.exec();
        result.location_count++;
    }
}

static void index_squares(sqlite3* db, const cache::CacheSource& source,
                          const BuildOptions& opts, const BuildProgressFunc& progress,
                          BuildResult& result) {
    mapsquare::MapSquareGrid grid(source, opts.extent);
    mapsquare::MapSquareDecoder decoder(source);

    SqliteStmt square_stmt(db,
        "INSERT INTO squares (i, j, status, message) VALUES (?1, ?2, ?3, ?4)");
    SqliteStmt placement_stmt(db,
        "INSERT INTO placements (loc_id, square_i, square_j, seq, plane, x, y, type, orientation)"
        " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");

    auto insert_square = [&](const mapsquare::Coord& c, const char* status, const std::string& msg) {
        square_stmt.reset();
        square_stmt.bind_int64(1, c.i);
        square_stmt.bind_int64(2, c.j);
        square_stmt.bind_text(3, status);
        square_stmt.bind_text(4, msg);
        square_stmt.exec();
    };

    size_t index = 0;
    const size_t total = grid.size();
    for (auto square : grid) {
        if (progress) {
            BuildProgress bp;
            bp.phase = "squares";
            bp.square_index = index;
            bp.square_total = total;
            bp.i = square.i();
            bp.j = square.j();
            progress(bp);
        }
        ++index;

        std::vector<mapsquare::PlacedLocation> locs;
        try {
            locs = decoder.locations(square);
        } catch (const mapsquare::AbsentError&) {
            insert_square(square.coord(), "absent", "");
            result.squares_absent++;
            continue;
        } catch (const binutil::DecodeError& e) {
            insert_square(square.coord(), "malformed", e.what());
            result.squares_malformed++;
            continue;
        } catch (const cache::CacheError& e) {
            insert_square(square.coord(), "malformed", e.what());
            result.squares_malformed++;
            continue;
        }

        insert_square(square.coord(), "ok", "");
        result.squares_ok++;

        int seq = 0;
        for (const auto& loc : locs) {
            placement_stmt.reset();
            placement_stmt.bind_int64(1, loc.id);
            placement_stmt.bind_int64(2, square.i());
            placement_stmt.bind_int64(3, square.j());
            placement_stmt.bind_int(4, seq++);
            placement_stmt.bind_int(5, loc.plane);
            placement_stmt.bind_int(6, loc.x);
            placement_stmt.bind_int(7, loc.y);
            placement_stmt.bind_int(8, static_cast<int>(loc.type));
            placement_stmt.bind_int(9, static_cast<int>(loc.orientation));
            placement_stmt.exec();
            result.placement_count++;
        }
    }
}

BuildResult DB::build_db(const std::string& db_path,
                         const cache::CacheSource& source,
                         const BuildOptions& opts,
                         BuildProgressFunc progress) {
    BuildResult result;

    // Write to a temp file and rename on success.
    std::string tmp_path = db_path + ".tmp";

    std::error_code ec;
    fs::remove(tmp_path, ec);

    sqlite3* db = open_db_handle(tmp_path,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    try {
        exec_sql(db, "PRAGMA journal_mode=WAL");
        exec_sql(db, "PRAGMA synchronous=NORMAL");
        exec_sql(db, schema_sql);

        exec_sql(db, "BEGIN TRANSACTION");

        {
            SqliteStmt meta_stmt(db,
                "INSERT OR REPLACE INTO meta (key, value) VALUES (?1, ?2)");

            auto insert_meta = [&](const char* key, const std::string& val) {
                meta_stmt.reset();
                meta_stmt.bind_text(1, key);
                meta_stmt.bind_text(2, val);
                meta_stmt.exec();
            };

            insert_meta("schema_version", schema_version);

            auto now = std::chrono::system_clock::now();
            auto tt = std::chrono::system_clock::to_time_t(now);
            char tbuf[64];
            struct tm tm_val;
            if (gmtime_utc(tt, tm_val)) {
                std::strftime(tbuf, sizeof(tbuf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
                insert_meta("created_at", tbuf);
            } else {
                insert_meta("created_at", "");
            }

            insert_meta("cache_dir", opts.cache_dir);
            insert_meta("grid_extent", std::format("{}x{}", opts.extent.width, opts.extent.height));
        }

        if (progress) {
            BuildProgress bp;
            bp.phase = "configs";
            progress(bp);
        }
        auto configs = locconfig::LocationConfigTable::load(source, opts.config);
        index_configs(db, *configs, result);

        index_squares(db, source, opts, progress, result);

        if (progress) {
            BuildProgress bp;
            bp.phase = "commit";
            progress(bp);
        }
        exec_sql(db, "COMMIT");

        // Checkpoint WAL so all data is in the main DB file before rename.
        exec_sql(db, "PRAGMA wal_checkpoint(TRUNCATE)");

        sqlite3_close(db);
        db = nullptr;

        fs::rename(tmp_path, db_path);

        fs::remove(tmp_path + "-wal", ec);
        fs::remove(tmp_path + "-shm", ec);

    } catch (...) {
        if (db) sqlite3_close(db);
        fs::remove(tmp_path, ec);
        fs::remove(tmp_path + "-wal", ec);
        fs::remove(tmp_path + "-shm", ec);
        throw;
    }

    return result;
}

// ---------------------------------------------------------------------------
// DB::open
// ---------------------------------------------------------------------------

DB DB::open(const std::string& path) {
    DB d;
    d.impl_->db = open_db_handle(path, SQLITE_OPEN_READONLY);

    if (!table_exists(d.impl_->db, "meta"))
        throw std::runtime_error("locindex: not a valid database (no meta table)");

    {
        SqliteStmt stmt(d.impl_->db,
            "SELECT value FROM meta WHERE key = 'schema_version'");
        if (stmt.step() != SQLITE_ROW)
            throw std::runtime_error("locindex: database missing schema_version");

        const char* ver = reinterpret_cast<const char*>(
            sqlite3_column_text(stmt.get(), 0));
        if (!ver || std::strcmp(ver, schema_version) != 0)
            throw std::runtime_error(
                std::format("locindex: schema version mismatch: expected {}, got {}",
                            schema_version, ver ? ver : "(null)"));
    }

    for (const char* tbl : {"locations", "placements", "squares"}) {
        if (!table_exists(d.impl_->db, tbl))
            throw std::runtime_error(
                std::format("locindex: missing required table '{}'", tbl));
    }

    return d;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

DBStats DB::stats() const {
    DBStats s;

    auto get_meta = [&](const char* key) -> std::string {
        SqliteStmt stmt(impl_->db, "SELECT value FROM meta WHERE key = ?1");
        stmt.bind_text(1, key);
        if (stmt.step() == SQLITE_ROW) return stmt.column_text(0);
        return "";
    };

    s.schema_version = get_meta("schema_version");
    s.created_at = get_meta("created_at");
    s.cache_dir = get_meta("cache_dir");

    auto count_query = [&](const char* sql) -> int {
        SqliteStmt stmt(impl_->db, sql);
        if (stmt.step() == SQLITE_ROW)
            return sqlite3_column_int(stmt.get(), 0);
        return 0;
    };

    s.location_count = count_query("SELECT COUNT(*) FROM locations");
    s.placement_count = count_query("SELECT COUNT(*) FROM placements");
    s.squares_ok = count_query("SELECT COUNT(*) FROM squares WHERE status = 'ok'");
    s.squares_absent = count_query("SELECT COUNT(*) FROM squares WHERE status = 'absent'");
    s.squares_malformed = count_query("SELECT COUNT(*) FROM squares WHERE status = 'malformed'");

    return s;
}

std::vector<mapsquare::Placement> DB::find_placements(uint32_t loc_id) const {
    SqliteStmt stmt(impl_->db,
        "SELECT square_i, square_j, plane, x, y, type, orientation FROM placements"
        " WHERE loc_id = ?1 ORDER BY square_i, square_j, seq");
    stmt.bind_int64(1, loc_id);

    std::vector<mapsquare::Placement> out;
    while (stmt.step() == SQLITE_ROW) {
        auto* s = stmt.get();
        mapsquare::Placement p;
        p.square.i = static_cast<uint32_t>(sqlite3_column_int64(s, 0));
        p.square.j = static_cast<uint32_t>(sqlite3_column_int64(s, 1));
        p.location.id = loc_id;
        p.location.plane = static_cast<uint8_t>(sqlite3_column_int(s, 2));
        p.location.x = static_cast<uint8_t>(sqlite3_column_int(s, 3));
        p.location.y = static_cast<uint8_t>(sqlite3_column_int(s, 4));
        p.location.type = static_cast<mapsquare::LocationType>(sqlite3_column_int(s, 5));
        p.location.orientation = static_cast<mapsquare::Orientation>(sqlite3_column_int(s, 6));
        out.push_back(p);
    }
    return out;
}

std::vector<LocationRow> DB::find_locations(const std::string& name_pattern) const {
    SqliteStmt stmt(impl_->db,
        "SELECT id, name, models FROM locations WHERE name != '' AND name LIKE ?1 ORDER BY id");
    stmt.bind_text(1, name_pattern);

    std::vector<LocationRow> out;
    while (stmt.step() == SQLITE_ROW) out.push_back(read_location_row(stmt));
    return out;
}

std::optional<LocationRow> DB::location(uint32_t id) const {
    SqliteStmt stmt(impl_->db, "SELECT id, name, models FROM locations WHERE id = ?1");
    stmt.bind_int64(1, id);
    if (stmt.step() != SQLITE_ROW) return std::nullopt;
    return read_location_row(stmt);
}

} // namespace rstools::locindex
