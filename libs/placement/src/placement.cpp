#include "tileforge/placement.h"

#include <algorithm>
#include <format>

namespace tileforge::placement {

using catalog::Category;

FillResult fill_ground(grid::Grid& g, Region region, std::string_view tile_id, bool overwrite) {
    FillResult res;
    const auto& cat = g.catalog();

    auto tile = cat.find(tile_id);
    if (!tile) {
        res.error = Error::UnknownTile;
        res.message = std::format("unknown tile \"{}\"", tile_id);
        res.suggestions = cat.suggest({Category::Ground}, 5);
        return res;
    }
    const auto& def = cat.at(*tile);
    if (def.category != Category::Ground) {
        res.error = Error::NotGroundTile;
        res.message =
            std::format("\"{}\" is not a ground tile (category: {})", def.id, catalog::to_string(def.category));
        return res;
    }

    res.region.x1 = std::max(0, std::min(region.x1, region.x2));
    res.region.y1 = std::max(0, std::min(region.y1, region.y2));
    res.region.x2 = std::min(g.width() - 1, std::max(region.x1, region.x2));
    res.region.y2 = std::min(g.height() - 1, std::max(region.y1, region.y2));

    for (int y = res.region.y1; y <= res.region.y2; y++) {
        for (int x = res.region.x1; x <= res.region.x2; x++) {
            if (!overwrite && g.get_tile(x, y, Layer::Ground)) {
                res.tiles_skipped++;
                continue;
            }
            if (g.set_tile(x, y, *tile, Layer::Ground) == Error::None) res.tiles_filled++;
        }
    }
    return res;
}

AssetResult place_asset(grid::Grid& g, Point at, std::string_view tile_id, std::optional<Layer> layer) {
    AssetResult res;
    res.at = at;
    res.tile_id = std::string(tile_id);

    if (!g.in_bounds(at.x, at.y)) {
        res.error = Error::OutOfBounds;
        res.message =
            std::format("position ({}, {}) is out of bounds, map is {}x{}", at.x, at.y, g.width(), g.height());
        return res;
    }

    const auto& cat = g.catalog();
    auto tile = cat.find(tile_id);
    if (!tile) {
        res.error = Error::UnknownTile;
        res.message = std::format("unknown asset \"{}\"", res.tile_id);
        res.suggestions = cat.suggest({Category::Building, Category::Prop, Category::Marker}, 5);
        return res;
    }

    res.layer = layer.value_or(cat.at(*tile).placement.layer);
    if (res.layer == Layer::Object) {
        if (!g.get_tile(at.x, at.y, Layer::Ground)) {
            res.error = Error::MissingGround;
            res.message = std::format("no ground tile under ({}, {})", at.x, at.y);
            return res;
        }
        if (auto existing = g.get_tile(at.x, at.y, Layer::Object)) {
            res.error = Error::CellOccupied;
            res.message = std::format("position already holds \"{}\"", cat.at(existing->tile).id);
            return res;
        }
    }

    Error err = g.set_tile(at.x, at.y, *tile, res.layer);
    if (err != Error::None) {
        res.error = err;
        res.message = to_string(err);
    }
    return res;
}

BatchResult place_assets(grid::Grid& g, const std::vector<AssetRequest>& requests) {
    BatchResult batch;
    batch.results.reserve(requests.size());
    for (const auto& req : requests) {
        auto r = place_asset(g, req.at, req.tile_id, req.layer);
        if (r.success()) batch.placed++;
        else batch.failed++;
        batch.results.push_back(std::move(r));
    }
    return batch;
}

} // namespace tileforge::placement
