#include "tileforge/grid.h"

#include <nlohmann/json.hpp>

#include <format>
#include <iomanip>
#include <stdexcept>

namespace tileforge::grid {

using json = nlohmann::ordered_json;

Grid::Grid(int width, int height, const catalog::Catalog& catalog)
    : width_(width), height_(height), catalog_(&catalog) {
    if (width <= 0 || height <= 0)
        throw std::invalid_argument(std::format("grid: dimensions must be positive, got {}x{}", width, height));
    ground_.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
    objects_.resize(ground_.size());
}

Error Grid::set_tile(int x, int y, std::string_view tile_id, Layer layer) {
    if (!in_bounds(x, y)) return Error::OutOfBounds;
    auto tile = catalog_->find(tile_id);
    if (!tile) return Error::UnknownTile;
    cells(layer)[index(x, y)] = Cell{*tile, layer};
    return Error::None;
}

Error Grid::set_tile(int x, int y, catalog::TileId tile, Layer layer) {
    if (!in_bounds(x, y)) return Error::OutOfBounds;
    if (!catalog_->contains(tile)) return Error::UnknownTile;
    cells(layer)[index(x, y)] = Cell{tile, layer};
    return Error::None;
}

std::optional<Cell> Grid::get_tile(int x, int y, Layer layer) const {
    if (!in_bounds(x, y)) return std::nullopt;
    return cells(layer)[index(x, y)];
}

const catalog::TileDefinition* Grid::definition_at(int x, int y, Layer layer) const {
    auto cell = get_tile(x, y, layer);
    if (!cell) return nullptr;
    return &catalog_->at(cell->tile);
}

void Grid::clear_tile(int x, int y, Layer layer) {
    if (!in_bounds(x, y)) return;
    cells(layer)[index(x, y)].reset();
}

bool Grid::is_road_at(int x, int y) const {
    const auto* def = definition_at(x, y, Layer::Ground);
    return def && catalog::is_road_type(def->connectivity.type);
}

bool Grid::has_road() const {
    for (const auto& c : ground_) {
        if (c && catalog::is_road_type(catalog_->at(c->tile).connectivity.type)) return true;
    }
    return false;
}

Stats Grid::stats() const {
    Stats s;
    s.total_cells = width_ * height_;
    for (size_t i = 0; i < ground_.size(); i++) {
        if (ground_[i]) s.ground_filled++;
        if (objects_[i]) s.objects_filled++;
    }
    return s;
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

MapData to_map_data(const Grid& g) {
    MapData m;
    m.width = g.width();
    m.height = g.height();
    auto dump_layer = [&](Layer layer) {
        LayerData rows(static_cast<size_t>(g.height()));
        for (int y = 0; y < g.height(); y++) {
            auto& row = rows[static_cast<size_t>(y)];
            row.resize(static_cast<size_t>(g.width()));
            for (int x = 0; x < g.width(); x++) {
                if (auto cell = g.get_tile(x, y, layer))
                    row[static_cast<size_t>(x)] = CellData{g.catalog().at(cell->tile).id, cell->layer};
            }
        }
        return rows;
    };
    m.ground = dump_layer(Layer::Ground);
    m.objects = dump_layer(Layer::Object);
    return m;
}

Grid from_map_data(const MapData& m, const catalog::Catalog& catalog) {
    Grid g(m.width, m.height, catalog);
    auto load_layer = [&](const LayerData& rows, Layer layer) {
        if (rows.size() > static_cast<size_t>(m.height))
            throw std::runtime_error(std::format("map: {} layer has too many rows", to_string(layer)));
        for (size_t y = 0; y < rows.size(); y++) {
            if (rows[y].size() > static_cast<size_t>(m.width))
                throw std::runtime_error(std::format("map: row {} is wider than the map", y));
            for (size_t x = 0; x < rows[y].size(); x++) {
                const auto& cell = rows[y][x];
                if (!cell) continue;
                Error err = g.set_tile(static_cast<int>(x), static_cast<int>(y), cell->tile_id, layer);
                if (err != Error::None)
                    throw std::runtime_error(
                        std::format("map: {} for \"{}\" at ({}, {})", to_string(err), cell->tile_id, x, y));
            }
        }
    };
    load_layer(m.ground, Layer::Ground);
    load_layer(m.objects, Layer::Object);
    return g;
}

static json layer_to_json(const LayerData& rows) {
    json out = json::array();
    for (const auto& row : rows) {
        json jr = json::array();
        for (const auto& cell : row) {
            if (cell)
                jr.push_back({{"tileId", cell->tile_id}, {"layer", to_string(cell->layer)}});
            else
                jr.push_back(nullptr);
        }
        out.push_back(std::move(jr));
    }
    return out;
}

static LayerData layer_from_json(const json& j, Layer default_layer) {
    LayerData rows;
    if (j.is_null()) return rows;
    if (!j.is_array()) throw std::runtime_error("map: layer must be an array of rows");
    for (const auto& jr : j) {
        std::vector<std::optional<CellData>> row;
        if (!jr.is_null()) {
            for (const auto& jc : jr) {
                if (jc.is_null()) {
                    row.emplace_back();
                    continue;
                }
                CellData cell;
                if (jc.contains("tileId")) cell.tile_id = jc.at("tileId").get<std::string>();
                else if (jc.contains("assetId")) cell.tile_id = jc.at("assetId").get<std::string>();
                else throw std::runtime_error("map: cell without tileId");
                cell.layer = default_layer;
                if (jc.contains("layer")) {
                    auto l = parse_layer(jc.at("layer").get<std::string>());
                    if (!l) throw std::runtime_error("map: invalid cell layer");
                    cell.layer = *l;
                }
                row.push_back(std::move(cell));
            }
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

void write_map(std::ostream& w, const MapData& m, bool pretty) {
    json root = {
        {"width", m.width},
        {"height", m.height},
        {"layers", {{"ground", layer_to_json(m.ground)}, {"objects", layer_to_json(m.objects)}}},
    };
    if (pretty) w << std::setw(2) << root << '\n';
    else w << root << '\n';
    if (!w) throw std::runtime_error("map: write failed");
}

MapData read_map(std::istream& r) {
    try {
        json root = json::parse(r);
        MapData m;
        m.width = root.at("width").get<int>();
        m.height = root.at("height").get<int>();
        if (m.width <= 0 || m.height <= 0) throw std::runtime_error("map: dimensions must be positive");
        if (root.contains("layers")) {
            const auto& layers = root.at("layers");
            if (layers.contains("ground")) m.ground = layer_from_json(layers.at("ground"), Layer::Ground);
            if (layers.contains("objects")) m.objects = layer_from_json(layers.at("objects"), Layer::Object);
        }
        return m;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("map: {}", e.what()));
    }
}

// ---------------------------------------------------------------------------
// ASCII view
// ---------------------------------------------------------------------------

static char object_glyph(catalog::Category c) {
    switch (c) {
        case catalog::Category::Building: return 'B';
        case catalog::Category::Prop: return 'P';
        case catalog::Category::Wall: return 'W';
        case catalog::Category::Marker: return 'M';
        default: return '?';
    }
}

AsciiView to_ascii(const Grid& g) {
    std::string header = "  ";
    for (int x = 0; x < g.width(); x++) header += static_cast<char>('0' + x % 10);
    header += '\n';

    AsciiView view;
    view.ground = header;
    view.objects = header;
    for (int y = 0; y < g.height(); y++) {
        std::string prefix = std::string(1, static_cast<char>('0' + y % 10)) + ' ';
        std::string ground_row = prefix;
        std::string object_row = prefix;
        for (int x = 0; x < g.width(); x++) {
            if (!g.get_tile(x, y, Layer::Ground)) ground_row += '.';
            else ground_row += g.is_road_at(x, y) ? 'R' : 'G';

            const auto* obj = g.definition_at(x, y, Layer::Object);
            object_row += obj ? object_glyph(obj->category) : '.';
        }
        view.ground += ground_row + '\n';
        view.objects += object_row + '\n';
    }
    view.ground += "\nLegend: R=road, G=ground, .=empty";
    view.objects += "\nLegend: B=building, P=prop, W=wall, M=marker, .=empty";
    return view;
}

} // namespace tileforge::grid
