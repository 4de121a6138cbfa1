#pragma once

#include "rstools/cache.h"
#include "rstools/js5.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace rstools::mapsquare {

// Tiles per map square edge.
constexpr uint32_t kSquareTiles = 64;
constexpr uint32_t kPlanes = 4;

// Largest location type value (ground decoration).
constexpr uint8_t kMaxLocationType = 22;

// AbsentError means the square has no location archive. It is the normal
// outcome for empty squares and is not a DecodeError.
class AbsentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Orientation : uint8_t { West = 0, North = 1, East = 2, South = 3 };

enum class LocationType : uint8_t {
    WallStraight = 0,
    WallDiagonalCorner = 1,
    WallCorner = 2,
    WallSquareCorner = 3,
    WallDecorStraightNoOffset = 4,
    WallDecorStraightOffset = 5,
    WallDecorDiagonalOffset = 6,
    WallDecorDiagonalNoOffset = 7,
    WallDecorDiagonalBoth = 8,
    WallDiagonal = 9,
    CentrepieceStraight = 10,
    CentrepieceDiagonal = 11,
    RoofStraight = 12,
    RoofDiagonalWithRoofEdge = 13,
    RoofDiagonal = 14,
    RoofCornerConcave = 15,
    RoofCornerConvex = 16,
    RoofFlat = 17,
    RoofEdgeStraight = 18,
    RoofEdgeDiagonalCorner = 19,
    RoofEdgeCorner = 20,
    RoofEdgeSquareCorner = 21,
    GroundDecor = 22,
};

const char* orientation_name(Orientation o);
const char* location_type_name(LocationType t);

struct Coord {
    uint32_t i = 0;
    uint32_t j = 0;

    // Packed id used by the game for a square (i << 8 | j).
    uint32_t id() const { return (i << 8) | j; }

    auto operator<=>(const Coord&) const = default;
};

struct PlacedLocation {
    uint32_t id = 0;
    uint8_t plane = 0;
    uint8_t x = 0; // tile within the square
    uint8_t y = 0;
    LocationType type = LocationType::WallStraight;
    Orientation orientation = Orientation::West;

    bool operator==(const PlacedLocation&) const = default;
};

struct WorldTile {
    uint32_t x = 0;
    uint32_t y = 0;
    uint8_t plane = 0;

    bool operator==(const WorldTile&) const = default;
};

// world_tile converts a square-local placement to absolute tile coordinates.
WorldTile world_tile(const Coord& square, const PlacedLocation& loc);

// locations_archive_name is the group name of a square's location data.
std::string locations_archive_name(uint32_t i, uint32_t j);

// MapSquare is a handle to one grid cell. It carries the resolved archive key
// of the location data, if the cache has one; nothing is decoded until the
// handle is passed to MapSquareDecoder.
class MapSquare {
public:
    MapSquare() = default;
    MapSquare(Coord coord, std::optional<cache::ArchiveKey> key) : coord_(coord), key_(key) {}

    const Coord& coord() const { return coord_; }
    uint32_t i() const { return coord_.i; }
    uint32_t j() const { return coord_.j; }
    const std::optional<cache::ArchiveKey>& locations_key() const { return key_; }

private:
    Coord coord_;
    std::optional<cache::ArchiveKey> key_;
};

struct GridExtent {
    uint32_t width = 100;  // values of i
    uint32_t height = 200; // values of j

    size_t count() const { return static_cast<size_t>(width) * height; }
    bool contains(uint32_t i, uint32_t j) const { return i < width && j < height; }
};

// MapSquareGrid addresses a fixed extent of map squares. The map index
// reference table is read at construction; squares are resolved by the name
// hash of "l<i>_<j>".
class MapSquareGrid {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = MapSquare;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = MapSquare;

        iterator() = default;
        iterator(const MapSquareGrid* grid, size_t pos) : grid_(grid), pos_(pos) {}

        MapSquare operator*() const;
        iterator& operator++() { ++pos_; return *this; }
        iterator operator++(int) { auto tmp = *this; ++pos_; return tmp; }
        bool operator==(const iterator& o) const { return pos_ == o.pos_ && grid_ == o.grid_; }

    private:
        const MapSquareGrid* grid_ = nullptr;
        size_t pos_ = 0;
    };

    // Throws cache::CacheError if the map reference table is unavailable.
    MapSquareGrid(const cache::CacheSource& source, GridExtent extent = {});

    // with_queried_extent sizes the grid to cover every square that has
    // location data, searching coordinates below the given limits.
    static MapSquareGrid with_queried_extent(const cache::CacheSource& source,
                                             GridExtent limit = {256, 256});

    const cache::CacheSource& source() const { return *source_; }
    const GridExtent& extent() const { return extent_; }
    size_t size() const { return extent_.count(); }

    // get returns the handle for (i, j). Coordinates outside the extent throw
    // std::out_of_range.
    MapSquare get(uint32_t i, uint32_t j) const;

    // Row-major: i outer, j inner. Iteration never decodes.
    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, extent_.count()); }

private:
    std::optional<cache::ArchiveKey> resolve(uint32_t i, uint32_t j) const;

    const cache::CacheSource* source_;
    GridExtent extent_;
    js5::ReferenceTable maps_;
};

// decode_locations parses a square's location record. An immediate
// terminator yields an empty list. Throws binutil::MalformedRecord on any
// structural problem.
std::vector<PlacedLocation> decode_locations(std::span<const uint8_t> data);

// MapSquareDecoder fetches and decodes location data for squares on demand.
class MapSquareDecoder {
public:
    explicit MapSquareDecoder(const cache::CacheSource& source) : source_(&source) {}

    // locations throws AbsentError when the square has no location archive,
    // binutil::MalformedRecord when the archive is inconsistent.
    std::vector<PlacedLocation> locations(const MapSquare& square) const;

private:
    const cache::CacheSource* source_;
};

// --- Whole-grid scans ---

struct Placement {
    Coord square;
    PlacedLocation location;

    bool operator==(const Placement&) const = default;
};

struct ScanFailure {
    Coord square;
    std::string message;
};

struct ScanResult {
    std::vector<Placement> placements;
    size_t squares_visited = 0;
    size_t squares_decoded = 0;
    size_t squares_absent = 0;
    std::vector<ScanFailure> failures; // malformed or unreadable squares
};

using PlacementFilter = std::function<bool(const Coord&, const PlacedLocation&)>;

struct ScanOptions {
    unsigned threads = 1;
    PlacementFilter filter; // empty keeps everything
};

// scan decodes every square of the grid and collects matching placements.
// Absent squares are counted and skipped; failing squares are recorded and
// never stop the scan. Results are ordered by square, then record order, for
// any thread count.
ScanResult scan(const MapSquareGrid& grid, const MapSquareDecoder& decoder, const ScanOptions& opts = {});

} // namespace rstools::mapsquare
