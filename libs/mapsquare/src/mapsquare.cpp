#include "rstools/mapsquare.h"
#include "rstools/binutil.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <format>
#include <mutex>
#include <thread>

namespace rstools::mapsquare {

using binutil::ByteCursor;
using binutil::MalformedRecord;
using binutil::OutOfBounds;

const char* orientation_name(Orientation o) {
    switch (o) {
    case Orientation::West: return "west";
    case Orientation::North: return "north";
    case Orientation::East: return "east";
    case Orientation::South: return "south";
    }
    return "unknown";
}

const char* location_type_name(LocationType t) {
    switch (t) {
    case LocationType::WallStraight: return "wall_straight";
    case LocationType::WallDiagonalCorner: return "wall_diagonal_corner";
    case LocationType::WallCorner: return "wall_corner";
    case LocationType::WallSquareCorner: return "wall_square_corner";
    case LocationType::WallDecorStraightNoOffset: return "wall_decor_straight_no_offset";
    case LocationType::WallDecorStraightOffset: return "wall_decor_straight_offset";
    case LocationType::WallDecorDiagonalOffset: return "wall_decor_diagonal_offset";
    case LocationType::WallDecorDiagonalNoOffset: return "wall_decor_diagonal_no_offset";
    case LocationType::WallDecorDiagonalBoth: return "wall_decor_diagonal_both";
    case LocationType::WallDiagonal: return "wall_diagonal";
    case LocationType::CentrepieceStraight: return "centrepiece_straight";
    case LocationType::CentrepieceDiagonal: return "centrepiece_diagonal";
    case LocationType::RoofStraight: return "roof_straight";
    case LocationType::RoofDiagonalWithRoofEdge: return "roof_diagonal_with_roof_edge";
    case LocationType::RoofDiagonal: return "roof_diagonal";
    case LocationType::RoofCornerConcave: return "roof_corner_concave";
    case LocationType::RoofCornerConvex: return "roof_corner_convex";
    case LocationType::RoofFlat: return "roof_flat";
    case LocationType::RoofEdgeStraight: return "roof_edge_straight";
    case LocationType::RoofEdgeDiagonalCorner: return "roof_edge_diagonal_corner";
    case LocationType::RoofEdgeCorner: return "roof_edge_corner";
    case LocationType::RoofEdgeSquareCorner: return "roof_edge_square_corner";
    case LocationType::GroundDecor: return "ground_decor";
    }
    return "unknown";
}

WorldTile world_tile(const Coord& square, const PlacedLocation& loc) {
    return WorldTile{square.i * kSquareTiles + loc.x, square.j * kSquareTiles + loc.y, loc.plane};
}

std::string locations_archive_name(uint32_t i, uint32_t j) {
    return std::format("l{}_{}", i, j);
}

// ---------------------------------------------------------------------------
// MapSquareGrid
// ---------------------------------------------------------------------------

MapSquare MapSquareGrid::iterator::operator*() const {
    uint32_t h = grid_->extent_.height;
    return grid_->get(static_cast<uint32_t>(pos_ / h), static_cast<uint32_t>(pos_ % h));
}

MapSquareGrid::MapSquareGrid(const cache::CacheSource& source, GridExtent extent)
    : source_(&source), extent_(extent), maps_(cache::load_reference_table(source, js5::kMapIndex)) {}

MapSquareGrid MapSquareGrid::with_queried_extent(const cache::CacheSource& source, GridExtent limit) {
    MapSquareGrid grid(source, GridExtent{0, 0});
    GridExtent found{0, 0};
    for (uint32_t i = 0; i < limit.width; i++) {
        for (uint32_t j = 0; j < limit.height; j++) {
            if (!grid.resolve(i, j)) continue;
            found.width = std::max(found.width, i + 1);
            found.height = std::max(found.height, j + 1);
        }
    }
    grid.extent_ = found;
    return grid;
}

std::optional<cache::ArchiveKey> MapSquareGrid::resolve(uint32_t i, uint32_t j) const {
    const auto* entry = maps_.find_by_name(locations_archive_name(i, j));
    if (!entry) return std::nullopt;
    return cache::ArchiveKey{js5::kMapIndex, entry->id};
}

MapSquare MapSquareGrid::get(uint32_t i, uint32_t j) const {
    if (!extent_.contains(i, j))
        throw std::out_of_range(std::format(
            "mapsquare: ({}, {}) outside grid of {}x{}", i, j, extent_.width, extent_.height));
    return MapSquare(Coord{i, j}, resolve(i, j));
}

// ---------------------------------------------------------------------------
// Location records
// ---------------------------------------------------------------------------

std::vector<PlacedLocation> decode_locations(std::span<const uint8_t> data) {
    std::vector<PlacedLocation> out;
    ByteCursor c(data);

    try {
        int64_t id = -1;
        for (;;) {
            uint32_t id_delta = c.read_extended_smart();
            if (id_delta == 0) break;
            id += id_delta;
            if (id > UINT32_MAX)
                throw MalformedRecord(std::format("mapsquare: location id overflow at offset {}", c.position()));

            uint32_t pos = 0;
            for (;;) {
                uint16_t pos_delta = c.read_smart();
                if (pos_delta == 0) break;
                pos += pos_delta - 1;
                if (pos >= (1u << 14))
                    throw MalformedRecord(std::format(
                        "mapsquare: location {} position {} outside square", id, pos));

                uint8_t attr = c.read_u8();
                uint8_t type = attr >> 2;
                if (type > kMaxLocationType)
                    throw MalformedRecord(std::format(
                        "mapsquare: location {} has invalid type {}", id, type));

                PlacedLocation loc;
                loc.id = static_cast<uint32_t>(id);
                loc.y = static_cast<uint8_t>(pos & 0x3F);
                loc.x = static_cast<uint8_t>((pos >> 6) & 0x3F);
                loc.plane = static_cast<uint8_t>((pos >> 12) & 0x3);
                loc.type = static_cast<LocationType>(type);
                loc.orientation = static_cast<Orientation>(attr & 0x3);
                out.push_back(loc);
            }
        }
    } catch (const OutOfBounds& e) {
        throw MalformedRecord(std::format("mapsquare: truncated location record: {}", e.what()));
    }
    return out;
}

std::vector<PlacedLocation> MapSquareDecoder::locations(const MapSquare& square) const {
    const auto& key = square.locations_key();
    if (!key)
        throw AbsentError(std::format("mapsquare: ({}, {}) has no location archive", square.i(), square.j()));

    auto data = source_->fetch(*key);
    if (!data)
        throw AbsentError(std::format("mapsquare: ({}, {}) archive {}/{} not found",
                                      square.i(), square.j(), key->index, key->archive));
    return decode_locations(*data);
}

// ---------------------------------------------------------------------------
// Scans
// ---------------------------------------------------------------------------

namespace {

enum class SquareStatus : uint8_t { Pending, Decoded, Absent, Failed };

struct SquareOutcome {
    SquareStatus status = SquareStatus::Pending;
    std::vector<PlacedLocation> matches;
    std::string message;
};

void scan_square(const MapSquare& square, const MapSquareDecoder& decoder,
                 const PlacementFilter& filter, SquareOutcome& out) {
    try {
        auto locs = decoder.locations(square);
        for (const auto& loc : locs) {
            if (!filter || filter(square.coord(), loc)) out.matches.push_back(loc);
        }
        out.status = SquareStatus::Decoded;
    } catch (const AbsentError&) {
        out.status = SquareStatus::Absent;
    } catch (const binutil::DecodeError& e) {
        out.status = SquareStatus::Failed;
        out.message = e.what();
    } catch (const cache::CacheError& e) {
        out.status = SquareStatus::Failed;
        out.message = e.what();
    }
}

} // namespace

ScanResult scan(const MapSquareGrid& grid, const MapSquareDecoder& decoder, const ScanOptions& opts) {
    const size_t total = grid.size();
    std::vector<SquareOutcome> outcomes(total);

    unsigned threads = std::max(1u, opts.threads);
    if (threads == 1 || total < 2) {
        size_t n = 0;
        for (auto square : grid) scan_square(square, decoder, opts.filter, outcomes[n++]);
    } else {
        threads = static_cast<unsigned>(std::min<size_t>(threads, total));
        std::atomic<size_t> next{0};
        std::mutex err_mu;
        std::exception_ptr first_error;

        auto worker = [&]() {
            for (;;) {
                size_t n = next.fetch_add(1);
                if (n >= total) return;
                try {
                    scan_square(*MapSquareGrid::iterator(&grid, n), decoder, opts.filter, outcomes[n]);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(err_mu);
                    if (!first_error) first_error = std::current_exception();
                    next = total;
                    return;
                }
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(threads);
        for (unsigned t = 0; t < threads; ++t) workers.emplace_back(worker);
        for (auto& w : workers) {
            if (w.joinable()) w.join();
        }
        if (first_error) std::rethrow_exception(first_error);
    }

    ScanResult result;
    result.squares_visited = total;
    for (size_t n = 0; n < total; n++) {
        auto& o = outcomes[n];
        Coord coord{static_cast<uint32_t>(n / grid.extent().height),
                    static_cast<uint32_t>(n % grid.extent().height)};
        switch (o.status) {
        case SquareStatus::Decoded:
            result.squares_decoded++;
            for (const auto& loc : o.matches) result.placements.push_back(Placement{coord, loc});
            break;
        case SquareStatus::Absent:
            result.squares_absent++;
            break;
        case SquareStatus::Failed:
            result.failures.push_back(ScanFailure{coord, std::move(o.message)});
            break;
        case SquareStatus::Pending:
            break;
        }
    }
    return result;
}

} // namespace rstools::mapsquare
