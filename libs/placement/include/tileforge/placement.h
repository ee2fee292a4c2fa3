#pragma once

#include <tileforge/core.h>
#include <tileforge/grid.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tileforge::placement {

// Region is an inclusive cell rectangle.
struct Region {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;
};

struct FillResult {
    Error error = Error::None;
    std::string message;
    std::vector<std::string> suggestions; // UnknownTile only
    int tiles_filled = 0;
    int tiles_skipped = 0;
    Region region; // after normalization and clamping

    bool success() const { return error == Error::None; }
};

// fill_ground paints a ground tile over a rectangle. Corners may come in any
// order and are clamped to the grid. Existing ground is kept unless overwrite.
FillResult fill_ground(grid::Grid& g, Region region, std::string_view tile_id, bool overwrite = false);

struct AssetResult {
    Error error = Error::None;
    std::string message;
    std::vector<std::string> suggestions; // UnknownTile only
    Point at;
    std::string tile_id;
    Layer layer = Layer::Object;

    bool success() const { return error == Error::None; }
};

// place_asset puts a building, prop or marker on the grid. The layer
// defaults to the tile's placement layer. Objects need ground underneath and
// a free object cell. Multi-cell footprints occupy their anchor cell only.
AssetResult place_asset(grid::Grid& g, Point at, std::string_view tile_id,
                        std::optional<Layer> layer = std::nullopt);

struct AssetRequest {
    Point at;
    std::string tile_id;
    std::optional<Layer> layer;
};

struct BatchResult {
    int placed = 0;
    int failed = 0;
    std::vector<AssetResult> results;

    bool success() const { return failed == 0; }
};

BatchResult place_assets(grid::Grid& g, const std::vector<AssetRequest>& requests);

} // namespace tileforge::placement
