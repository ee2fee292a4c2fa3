#pragma once

#include <tileforge/catalog.h>
#include <tileforge/core.h>

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tileforge::grid {

// Cell is one occupied position of a layer.
struct Cell {
    catalog::TileId tile;
    Layer layer = Layer::Ground;

    friend bool operator==(const Cell&, const Cell&) = default;
};

struct Stats {
    int total_cells = 0;
    int ground_filled = 0;
    int objects_filled = 0;
};

// Grid owns the ground and object layers of one map. It borrows the catalog,
// which must outlive it. Single writer; callers pass it by reference.
class Grid {
public:
    // Throws std::invalid_argument for non-positive dimensions.
    Grid(int width, int height, const catalog::Catalog& catalog);

    int width() const { return width_; }
    int height() const { return height_; }
    const catalog::Catalog& catalog() const { return *catalog_; }

    bool in_bounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }

    // set_tile overwrites a cell. On failure the grid is left unchanged.
    [[nodiscard]] Error set_tile(int x, int y, std::string_view tile_id, Layer layer);
    [[nodiscard]] Error set_tile(int x, int y, catalog::TileId tile, Layer layer);

    // get_tile returns nullopt for empty or out-of-bounds cells.
    std::optional<Cell> get_tile(int x, int y, Layer layer) const;
    const catalog::TileDefinition* definition_at(int x, int y, Layer layer) const;

    void clear_tile(int x, int y, Layer layer);

    bool is_road_at(int x, int y) const;
    bool has_road() const;
    Stats stats() const;

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x);
    }
    std::vector<std::optional<Cell>>& cells(Layer layer) { return layer == Layer::Ground ? ground_ : objects_; }
    const std::vector<std::optional<Cell>>& cells(Layer layer) const {
        return layer == Layer::Ground ? ground_ : objects_;
    }

    int width_ = 0;
    int height_ = 0;
    const catalog::Catalog* catalog_ = nullptr;
    std::vector<std::optional<Cell>> ground_;
    std::vector<std::optional<Cell>> objects_;
};

// ---------------------------------------------------------------------------
// Serialized form
// ---------------------------------------------------------------------------

struct CellData {
    std::string tile_id;
    Layer layer = Layer::Ground;

    friend bool operator==(const CellData&, const CellData&) = default;
};

using LayerData = std::vector<std::vector<std::optional<CellData>>>; // [y][x]

// MapData is the string-keyed snapshot handed to renderers and written to disk.
struct MapData {
    int width = 0;
    int height = 0;
    LayerData ground;
    LayerData objects;

    friend bool operator==(const MapData&, const MapData&) = default;
};

MapData to_map_data(const Grid& g);

// from_map_data rebuilds a grid. Throws std::runtime_error on shape
// mismatches or ids missing from the catalog.
Grid from_map_data(const MapData& m, const catalog::Catalog& catalog);

void write_map(std::ostream& w, const MapData& m, bool pretty = false);
MapData read_map(std::istream& r);

// ---------------------------------------------------------------------------
// ASCII view
// ---------------------------------------------------------------------------

struct AsciiView {
    std::string ground;  // R=road, G=ground, .=empty
    std::string objects; // B=building, P=prop, W=wall, M=marker, .=empty
};

AsciiView to_ascii(const Grid& g);

} // namespace tileforge::grid
