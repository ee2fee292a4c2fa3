#include "tileforge/connectivity.h"

namespace tileforge::connectivity {

Resolver::Resolver(const catalog::Catalog& catalog)
    : catalog_(&catalog), candidates_(catalog.road_tiles()) {}

bool Resolver::is_road(catalog::TileId tile) const {
    return catalog_->contains(tile) && catalog::is_road_type(catalog_->at(tile).connectivity.type);
}

std::optional<catalog::TileId> Resolver::find_exact_match(DirectionSet required) const {
    for (auto id : catalog_->with_connections(required)) {
        if (catalog_->at(id).is_road()) return id;
    }
    return std::nullopt;
}

std::optional<catalog::TileId> Resolver::upgrade(catalog::TileId current, Direction added) const {
    const DirectionSet have = catalog_->at(current).connectivity.connects;
    const DirectionSet want = have.with(added);
    if (want == have) return std::nullopt;

    auto match = find_exact_match(want);
    if (!match || *match == current) return std::nullopt;
    return match;
}

} // namespace tileforge::connectivity
