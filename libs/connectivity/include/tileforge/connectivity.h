#pragma once

#include <tileforge/catalog.h>
#include <tileforge/core.h>

#include <optional>
#include <vector>

namespace tileforge::connectivity {

// Resolver picks road tile variants by their connection sets. Candidates are
// the ground-category road tiles of the catalog, kept in catalog order so the
// first match wins.
class Resolver {
public:
    explicit Resolver(const catalog::Catalog& catalog);

    const catalog::Catalog& catalog() const { return *catalog_; }
    const std::vector<catalog::TileId>& road_tiles() const { return candidates_; }

    bool is_road(catalog::TileId tile) const;

    // find_exact_match returns the first road tile whose connects set equals
    // required. nullopt means no variant exists; callers skip and report.
    std::optional<catalog::TileId> find_exact_match(DirectionSet required) const;

    // upgrade returns the road tile connecting current's directions plus
    // added, or nullopt when current already connects there or no variant
    // exists.
    std::optional<catalog::TileId> upgrade(catalog::TileId current, Direction added) const;

private:
    const catalog::Catalog* catalog_;
    std::vector<catalog::TileId> candidates_;
};

} // namespace tileforge::connectivity
