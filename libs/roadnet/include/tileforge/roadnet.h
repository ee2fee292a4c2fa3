#pragma once

#include <tileforge/connectivity.h>
#include <tileforge/core.h>
#include <tileforge/grid.h>
#include <tileforge/roads.h>

#include <optional>
#include <vector>

namespace tileforge::roadnet {

struct Bounds {
    int min_x = 0;
    int max_x = 0;
    int min_y = 0;
    int max_y = 0;
};

// Island is a maximal 4-connected group of road tiles.
struct Island {
    std::vector<Point> tiles; // flood-fill order, seed first
    Bounds bounds;
};

struct Report {
    bool connected = true;
    int total_tiles = 0;
    int island_count = 0;
    std::vector<Island> islands;
};

// road_positions lists every ground cell holding a road tile, row-major.
// Always computed from the current grid state.
std::vector<Point> road_positions(const grid::Grid& g);

// islands flood-fills the road network using 4-adjacency. Seeds are taken
// in row-major order.
std::vector<Island> islands(const grid::Grid& g);

// validate reports connectivity. Zero or one island counts as connected.
Report validate(const grid::Grid& g);

// Bridge is the closest tile pair between two islands.
struct Bridge {
    Point from;
    Point to;
    int distance = 0;
};

// nearest_pair scans all tile pairs; the first minimum found wins.
std::optional<Bridge> nearest_pair(const Island& a, const Island& b);

struct RepairResult {
    bool success = false;          // final connected flag
    bool already_connected = false;
    int previous_island_count = 0;
    int final_island_count = 0;
    int tiles_placed = 0;
    int tiles_upgraded = 0;
    std::vector<Bridge> bridges;
    std::vector<roads::CellError> errors;
};

// repair bridges consecutive islands with Manhattan roads that never
// overwrite existing road tiles. Best effort: unresolved cells are reported
// and the result may still be disconnected.
RepairResult repair(grid::Grid& g, const connectivity::Resolver& r);

} // namespace tileforge::roadnet
