#include "tileforge/catalog.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tileforge::catalog {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Enum names
// ---------------------------------------------------------------------------

const char* to_string(Category c) {
    switch (c) {
        case Category::Ground: return "ground";
        case Category::Building: return "building";
        case Category::Prop: return "prop";
        case Category::Wall: return "wall";
        case Category::Marker: return "marker";
    }
    return "ground";
}

const char* to_string(ConnectivityType t) {
    switch (t) {
        case ConnectivityType::None: return "none";
        case ConnectivityType::Path: return "path";
        case ConnectivityType::Edge: return "edge";
        case ConnectivityType::Corner: return "corner";
        case ConnectivityType::Intersection: return "intersection";
        case ConnectivityType::Cap: return "cap";
    }
    return "none";
}

const char* to_string(Anchor a) {
    switch (a) {
        case Anchor::TopLeft: return "top_left";
        case Anchor::BottomCenter: return "bottom_center";
        case Anchor::Center: return "center";
    }
    return "top_left";
}

std::optional<Category> parse_category(std::string_view s) {
    if (s == "ground") return Category::Ground;
    if (s == "building") return Category::Building;
    if (s == "prop") return Category::Prop;
    if (s == "wall") return Category::Wall;
    if (s == "marker") return Category::Marker;
    return std::nullopt;
}

std::optional<ConnectivityType> parse_connectivity_type(std::string_view s) {
    if (s == "none") return ConnectivityType::None;
    if (s == "path") return ConnectivityType::Path;
    if (s == "edge") return ConnectivityType::Edge;
    if (s == "corner") return ConnectivityType::Corner;
    if (s == "intersection") return ConnectivityType::Intersection;
    if (s == "cap") return ConnectivityType::Cap;
    return std::nullopt;
}

std::optional<Anchor> parse_anchor(std::string_view s) {
    if (s == "top_left") return Anchor::TopLeft;
    if (s == "bottom_center") return Anchor::BottomCenter;
    if (s == "center") return Anchor::Center;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

Catalog::Catalog(std::string theme, int tile_size, int columns, int rows, std::vector<TileDefinition> tiles)
    : theme_(std::move(theme)), tile_size_(tile_size), columns_(columns), rows_(rows), tiles_(std::move(tiles)) {
    index_.reserve(tiles_.size());
    for (size_t i = 0; i < tiles_.size(); i++) {
        if (!index_.emplace(tiles_[i].id, static_cast<uint32_t>(i)).second)
            throw std::runtime_error(std::format("catalog: duplicate tile id \"{}\"", tiles_[i].id));
    }
}

std::optional<TileId> Catalog::find(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) return std::nullopt;
    return TileId{it->second};
}

std::vector<TileId> Catalog::by_category(Category c) const {
    std::vector<TileId> out;
    for (uint32_t i = 0; i < tiles_.size(); i++) {
        if (tiles_[i].category == c) out.push_back({i});
    }
    return out;
}

std::vector<TileId> Catalog::by_connectivity(ConnectivityType t) const {
    std::vector<TileId> out;
    for (uint32_t i = 0; i < tiles_.size(); i++) {
        if (tiles_[i].connectivity.type == t) out.push_back({i});
    }
    return out;
}

std::vector<TileId> Catalog::with_connections(DirectionSet dirs) const {
    std::vector<TileId> out;
    for (uint32_t i = 0; i < tiles_.size(); i++) {
        if (tiles_[i].connectivity.connects == dirs) out.push_back({i});
    }
    return out;
}

std::vector<TileId> Catalog::road_tiles() const {
    std::vector<TileId> out;
    for (uint32_t i = 0; i < tiles_.size(); i++) {
        if (tiles_[i].is_road()) out.push_back({i});
    }
    return out;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::vector<TileId> Catalog::filter_by_description(const std::vector<TileId>& tiles,
                                                   std::string_view keywords) const {
    std::vector<std::string> terms;
    std::istringstream ss(lower(keywords));
    for (std::string t; ss >> t;) terms.push_back(t);

    std::vector<TileId> out;
    for (auto id : tiles) {
        std::string desc = lower(at(id).description);
        bool hit = std::any_of(terms.begin(), terms.end(), [&](const std::string& term) {
            return desc.find(term) != std::string::npos;
        });
        if (hit) out.push_back(id);
    }
    return out;
}

std::vector<std::string> Catalog::suggest(const std::vector<Category>& categories, size_t max) const {
    std::vector<std::string> out;
    for (auto c : categories) {
        for (auto id : by_category(c)) {
            if (out.size() >= max) return out;
            out.push_back(tiles_[id.index].id);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

std::string validate_connectivity(const Connectivity& c) {
    const DirectionSet& d = c.connects;
    int n = d.size();
    switch (c.type) {
        case ConnectivityType::None:
            if (n != 0) return "type none must not connect";
            return {};
        case ConnectivityType::Path:
            if (d == DirectionSet{Direction::East, Direction::West} ||
                d == DirectionSet{Direction::North, Direction::South})
                return {};
            return "path must connect two opposite directions";
        case ConnectivityType::Corner:
            if (n == 2 && !(d == DirectionSet{Direction::East, Direction::West}) &&
                !(d == DirectionSet{Direction::North, Direction::South}))
                return {};
            return "corner must connect two adjacent directions";
        case ConnectivityType::Intersection:
            if (n >= 3) return {};
            return "intersection must connect three or four directions";
        case ConnectivityType::Cap:
            if (n == 1) return {};
            return "cap must connect exactly one direction";
        case ConnectivityType::Edge:
            if (n <= 2) return {};
            return "edge connects at most two directions";
    }
    return {};
}

// ---------------------------------------------------------------------------
// JSON loading
// ---------------------------------------------------------------------------

static std::string field_error(size_t idx, const std::string& id, const std::string& what) {
    if (id.empty()) return std::format("catalog: tile #{}: {}", idx, what);
    return std::format("catalog: tile #{} (\"{}\"): {}", idx, id, what);
}

static TileDefinition parse_tile(const json& j, size_t idx, const LoadOptions& opt) {
    if (!j.is_object()) throw std::runtime_error(field_error(idx, "", "expected an object"));

    TileDefinition t;
    t.id = j.value("id", std::string{});
    if (t.id.empty()) throw std::runtime_error(field_error(idx, "", "missing id"));

    auto cat = parse_category(j.value("category", std::string{}));
    if (!cat) throw std::runtime_error(field_error(idx, t.id, "invalid category"));
    t.category = *cat;

    t.col = j.value("col", 0);
    t.row = j.value("row", 0);
    t.footprint.w = j.value("w", 1);
    t.footprint.h = j.value("h", 1);
    if (t.col < 0 || t.row < 0) throw std::runtime_error(field_error(idx, t.id, "negative atlas position"));
    if (t.footprint.w < 1 || t.footprint.h < 1)
        throw std::runtime_error(field_error(idx, t.id, "footprint must be at least 1x1"));

    t.description = j.value("description", std::string{});

    if (j.contains("placement")) {
        const auto& p = j.at("placement");
        auto layer = parse_layer(p.value("layer", std::string("ground")));
        if (!layer) throw std::runtime_error(field_error(idx, t.id, "invalid placement layer"));
        t.placement.layer = *layer;
        t.placement.walkable = p.value("walkable", true);
        auto anchor = parse_anchor(p.value("anchor", std::string("top_left")));
        if (!anchor) throw std::runtime_error(field_error(idx, t.id, "invalid placement anchor"));
        t.placement.anchor = *anchor;
    }

    if (j.contains("connectivity") && !j.at("connectivity").is_null()) {
        const auto& c = j.at("connectivity");
        auto type = parse_connectivity_type(c.value("type", std::string("none")));
        if (!type) throw std::runtime_error(field_error(idx, t.id, "invalid connectivity type"));
        t.connectivity.type = *type;
        if (c.contains("connects") && !c.at("connects").is_null()) {
            for (const auto& d : c.at("connects")) {
                auto dir = parse_direction(d.get<std::string>());
                if (!dir)
                    throw std::runtime_error(field_error(idx, t.id, std::format("invalid direction {}", d.dump())));
                t.connectivity.connects.insert(*dir);
            }
        }
        if (c.contains("contentSide") && c.at("contentSide").is_string()) {
            auto side = parse_direction(c.at("contentSide").get<std::string>());
            if (!side) throw std::runtime_error(field_error(idx, t.id, "invalid contentSide"));
            t.connectivity.content_side = side;
        }
    }

    if (opt.strict_connectivity) {
        std::string why = validate_connectivity(t.connectivity);
        if (!why.empty()) throw std::runtime_error(field_error(idx, t.id, why));
    }

    if (j.contains("variants") && j.at("variants").is_array()) {
        for (const auto& v : j.at("variants")) t.variants.push_back(v.get<std::string>());
    }
    return t;
}

Catalog load(std::istream& r, const LoadOptions& opt) {
    json root;
    try {
        root = json::parse(r);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("catalog: invalid JSON: {}", e.what()));
    }
    if (!root.is_object()) throw std::runtime_error("catalog: root must be an object");

    try {
        int tile_size = root.value("tileSize", 0);
        if (tile_size <= 0) throw std::runtime_error("catalog: tileSize must be positive");
        int columns = root.value("columns", 0);
        int rows = root.value("rows", 0);

        const char* list_key = root.contains("sprites") ? "sprites" : "tiles";
        if (!root.contains(list_key) || !root.at(list_key).is_array())
            throw std::runtime_error("catalog: missing sprites array");

        std::vector<TileDefinition> tiles;
        const auto& list = root.at(list_key);
        tiles.reserve(list.size());
        for (size_t i = 0; i < list.size(); i++) {
            TileDefinition t = parse_tile(list[i], i, opt);
            if (columns > 0 && t.col + t.footprint.w > columns)
                throw std::runtime_error(field_error(i, t.id, "extends past atlas columns"));
            if (rows > 0 && t.row + t.footprint.h > rows)
                throw std::runtime_error(field_error(i, t.id, "extends past atlas rows"));
            tiles.push_back(std::move(t));
        }

        Catalog cat(root.value("theme", std::string{}), tile_size, columns, rows, std::move(tiles));
        if (root.contains("sceneDescription") && root.at("sceneDescription").is_string())
            cat.set_scene_description(root.at("sceneDescription").get<std::string>());
        return cat;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("catalog: {}", e.what()));
    }
}

Catalog load_file(const std::string& path, const LoadOptions& opt) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error(std::format("catalog: cannot open {}", path));
    return load(f, opt);
}

} // namespace tileforge::catalog
