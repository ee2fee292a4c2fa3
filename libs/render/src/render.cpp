#include "tileforge/render.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_map>
#include <utility>

namespace tileforge::render {

int scaled_tile_size(int tile_size, double scale) {
    return std::max(1, static_cast<int>(std::lround(tile_size * scale)));
}

raster::Image extract_sprite(const raster::Image& atlas, const catalog::TileDefinition& def, int tile_size,
                             double scale) {
    const int x = def.col * tile_size;
    const int y = def.row * tile_size;
    const int w = def.footprint.w * tile_size;
    const int h = def.footprint.h * tile_size;

    if (!raster::contains_region(atlas, x, y, w, h)) {
        throw AtlasRegionError(def.id, std::format("render: atlas region for \"{}\" ({}, {}, {}x{}) is outside the "
                                                   "{}x{} atlas",
                                                   def.id, x, y, w, h, atlas.width, atlas.height));
    }

    const int out_w = std::max(1, static_cast<int>(std::lround(w * scale)));
    const int out_h = std::max(1, static_cast<int>(std::lround(h * scale)));
    return raster::resize_nearest(raster::crop(atlas, x, y, w, h), out_w, out_h);
}

Renderer::Renderer(const catalog::Catalog& catalog, const raster::Image& atlas)
    : catalog_(&catalog),
      extract_([&catalog, &atlas](const catalog::TileDefinition& def, double scale) {
          return extract_sprite(atlas, def, catalog.tile_size(), scale);
      }) {}

Renderer::Renderer(const catalog::Catalog& catalog, SpriteExtractor extractor)
    : catalog_(&catalog), extract_(std::move(extractor)) {}

namespace {

struct Patch {
    int x = 0;
    int y = 0;
    const raster::Image* sprite = nullptr;
};

} // namespace

RenderResult Renderer::render(const grid::MapData& map, const RenderOptions& opt) const {
    if (map.width <= 0 || map.height <= 0)
        throw std::runtime_error(std::format("render: invalid map dimensions {}x{}", map.width, map.height));
    if (!(opt.scale > 0.0)) throw std::runtime_error("render: scale must be positive");

    const int cell = scaled_tile_size(catalog_->tile_size(), opt.scale);

    RenderResult res;
    res.scale = opt.scale;
    res.width = map.width * cell;
    res.height = map.height * cell;

    // Extract every referenced sprite up front, one per unique id.
    std::unordered_map<std::string, raster::Image> sprites;
    std::vector<Patch> ground;
    std::vector<Patch> objects;

    auto collect = [&](const grid::LayerData& layer, std::vector<Patch>& out) {
        for (size_t y = 0; y < layer.size(); y++) {
            for (size_t x = 0; x < layer[y].size(); x++) {
                const auto& c = layer[y][x];
                if (!c) continue;

                auto it = sprites.find(c->tile_id);
                if (it == sprites.end()) {
                    auto tile = catalog_->find(c->tile_id);
                    if (!tile) {
                        res.warnings.push_back(std::format("unknown tile \"{}\" at ({}, {})", c->tile_id, x, y));
                        continue;
                    }
                    it = sprites.emplace(c->tile_id, extract_(catalog_->at(*tile), opt.scale)).first;
                }
                out.push_back({static_cast<int>(x) * cell, static_cast<int>(y) * cell, &it->second});
            }
        }
    };
    if (opt.ground) collect(map.ground, ground);
    if (opt.objects) collect(map.objects, objects);

    res.image = raster::filled(res.width, res.height, opt.background);
    for (const auto& p : ground) raster::composite_over(res.image, *p.sprite, p.x, p.y);
    for (const auto& p : objects) raster::composite_over(res.image, *p.sprite, p.x, p.y);

    res.stats.ground_tiles_rendered = static_cast<int>(ground.size());
    res.stats.object_tiles_rendered = static_cast<int>(objects.size());
    res.stats.unique_sprites_used = static_cast<int>(sprites.size());
    return res;
}

RenderResult Renderer::render(const grid::Grid& g, const RenderOptions& opt) const {
    return render(grid::to_map_data(g), opt);
}

} // namespace tileforge::render
