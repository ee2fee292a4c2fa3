#pragma once

#include <tileforge/core.h>

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tileforge::catalog {

enum class Category { Ground, Building, Prop, Wall, Marker };
enum class ConnectivityType { None, Path, Edge, Corner, Intersection, Cap };
enum class Anchor { TopLeft, BottomCenter, Center };

const char* to_string(Category c);
const char* to_string(ConnectivityType t);
const char* to_string(Anchor a);

std::optional<Category> parse_category(std::string_view s);
std::optional<ConnectivityType> parse_connectivity_type(std::string_view s);
std::optional<Anchor> parse_anchor(std::string_view s);

// is_road_type reports whether tiles of this type belong to the road network.
constexpr bool is_road_type(ConnectivityType t) {
    return t == ConnectivityType::Path || t == ConnectivityType::Corner ||
           t == ConnectivityType::Intersection || t == ConnectivityType::Cap;
}

struct Footprint {
    int w = 1;
    int h = 1;
};

struct Placement {
    Layer layer = Layer::Ground;
    bool walkable = true;
    Anchor anchor = Anchor::TopLeft;
};

struct Connectivity {
    ConnectivityType type = ConnectivityType::None;
    DirectionSet connects;
    std::optional<Direction> content_side; // edges only
};

// TileDefinition is one catalog entry. col/row address the atlas grid.
struct TileDefinition {
    std::string id;
    Category category = Category::Ground;
    int col = 0;
    int row = 0;
    Footprint footprint;
    Placement placement;
    Connectivity connectivity;
    std::string description;
    std::vector<std::string> variants;

    bool is_road() const {
        return category == Category::Ground && is_road_type(connectivity.type);
    }
};

// TileId is an interned handle: the index of a tile in catalog order.
struct TileId {
    uint32_t index = 0;

    friend constexpr bool operator==(TileId, TileId) = default;
};

// Catalog is the ordered, validated tile set. Lookup by string happens once
// at the boundary; everything downstream works on TileId handles.
class Catalog {
public:
    Catalog() = default;
    Catalog(std::string theme, int tile_size, int columns, int rows, std::vector<TileDefinition> tiles);

    const std::string& theme() const { return theme_; }
    int tile_size() const { return tile_size_; }
    int columns() const { return columns_; }
    int rows() const { return rows_; }
    const std::string& scene_description() const { return scene_description_; }
    void set_scene_description(std::string s) { scene_description_ = std::move(s); }

    size_t size() const { return tiles_.size(); }
    bool contains(TileId id) const { return id.index < tiles_.size(); }
    const std::vector<TileDefinition>& tiles() const { return tiles_; }

    // at returns the definition of a handle obtained from this catalog.
    const TileDefinition& at(TileId id) const { return tiles_.at(id.index); }

    std::optional<TileId> find(std::string_view id) const;

    // Queries, all in catalog order.
    std::vector<TileId> by_category(Category c) const;
    std::vector<TileId> by_connectivity(ConnectivityType t) const;
    std::vector<TileId> with_connections(DirectionSet dirs) const;
    std::vector<TileId> road_tiles() const;
    std::vector<TileId> filter_by_description(const std::vector<TileId>& tiles, std::string_view keywords) const;

    // suggest lists up to max ids from the given categories, for error messages.
    std::vector<std::string> suggest(const std::vector<Category>& categories, size_t max) const;

private:
    std::string theme_;
    std::string scene_description_;
    int tile_size_ = 0;
    int columns_ = 0;
    int rows_ = 0;
    std::vector<TileDefinition> tiles_;
    std::unordered_map<std::string, uint32_t> index_;
};

struct LoadOptions {
    // Reject tiles whose connects set does not fit their connectivity type.
    bool strict_connectivity = true;
};

// validate_connectivity checks the type/arity relationship of a descriptor.
// Returns an empty string when valid, otherwise the reason.
std::string validate_connectivity(const Connectivity& c);

// load parses catalog JSON (spritesheet metadata). Throws std::runtime_error
// on malformed input, duplicate ids or invalid descriptors.
Catalog load(std::istream& r, const LoadOptions& opt = {});
Catalog load_file(const std::string& path, const LoadOptions& opt = {});

} // namespace tileforge::catalog
