#pragma once

#include <tileforge/catalog.h>
#include <tileforge/grid.h>
#include <tileforge/raster.h>

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tileforge::render {

// AtlasRegionError is thrown when a tile's atlas rectangle lies outside the
// atlas image. It aborts the whole render call.
class AtlasRegionError : public std::runtime_error {
public:
    AtlasRegionError(const std::string& tile_id, const std::string& what)
        : std::runtime_error(what), tile_id_(tile_id) {}

    const std::string& tile_id() const { return tile_id_; }

private:
    std::string tile_id_;
};

struct RenderOptions {
    double scale = 0.25;
    raster::Rgba background{0, 0, 0, 255};
    bool ground = true;
    bool objects = true;
};

struct RenderStats {
    int ground_tiles_rendered = 0;
    int object_tiles_rendered = 0;
    int unique_sprites_used = 0;
};

struct RenderResult {
    raster::Image image;
    int width = 0;
    int height = 0;
    double scale = 0.0;
    RenderStats stats;
    std::vector<std::string> warnings; // skipped cells
};

// scaled_tile_size is round(tile_size * scale), never below one pixel.
int scaled_tile_size(int tile_size, double scale);

// extract_sprite crops the tile's atlas rectangle and scales it with the
// nearest-neighbor kernel. Throws AtlasRegionError.
raster::Image extract_sprite(const raster::Image& atlas, const catalog::TileDefinition& def, int tile_size,
                             double scale);

using SpriteExtractor = std::function<raster::Image(const catalog::TileDefinition&, double scale)>;

// Renderer composites a map from catalog sprites. Each unique tile id is
// extracted once per render call.
class Renderer {
public:
    // The atlas is borrowed and must outlive the renderer.
    Renderer(const catalog::Catalog& catalog, const raster::Image& atlas);
    Renderer(const catalog::Catalog& catalog, SpriteExtractor extractor);

    RenderResult render(const grid::MapData& map, const RenderOptions& opt = {}) const;
    RenderResult render(const grid::Grid& g, const RenderOptions& opt = {}) const;

private:
    const catalog::Catalog* catalog_;
    SpriteExtractor extract_;
};

} // namespace tileforge::render
