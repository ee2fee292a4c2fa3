#include "tileforge/roads.h"

#include <format>

namespace tileforge::roads {

// ---------------------------------------------------------------------------
// Route
// ---------------------------------------------------------------------------

std::vector<Point> manhattan_route(Point from, Point to) {
    std::vector<Point> route;
    route.reserve(static_cast<size_t>(manhattan(from, to)) + 1);

    Point p = from;
    while (p.x != to.x) {
        route.push_back(p);
        p.x += p.x < to.x ? 1 : -1;
    }
    while (p.y != to.y) {
        route.push_back(p);
        p.y += p.y < to.y ? 1 : -1;
    }
    route.push_back(to);
    return route;
}

DirectionSet route_connections(const std::vector<Point>& route, size_t i) {
    DirectionSet out;
    if (i >= route.size()) return out;
    if (i > 0) {
        if (auto d = direction_between(route[i], route[i - 1])) out.insert(*d);
    }
    if (i + 1 < route.size()) {
        if (auto d = direction_between(route[i], route[i + 1])) out.insert(*d);
    }
    return out;
}

DirectionSet adjacent_road_connections(const grid::Grid& g, Point p) {
    DirectionSet out;
    for (auto d : all_directions) {
        Point n = step(p, d);
        const auto* def = g.definition_at(n.x, n.y, Layer::Ground);
        if (!def || !catalog::is_road_type(def->connectivity.type)) continue;
        if (def->connectivity.connects.contains(opposite(d))) out.insert(d);
    }
    return out;
}

bool upgrade_neighbor(grid::Grid& g, const connectivity::Resolver& r, Point p, Direction toward) {
    auto cell = g.get_tile(p.x, p.y, Layer::Ground);
    if (!cell || !r.is_road(cell->tile)) return false;

    auto upgraded = r.upgrade(cell->tile, toward);
    if (!upgraded) return false;
    return g.set_tile(p.x, p.y, *upgraded, Layer::Ground) == Error::None;
}

// ---------------------------------------------------------------------------
// Path placement
// ---------------------------------------------------------------------------

PlaceResult place_path(grid::Grid& g, const connectivity::Resolver& r, Point from, Point to,
                       const PlaceOptions& opt) {
    PlaceResult result;
    const auto route = manhattan_route(from, to);

    for (size_t i = 0; i < route.size(); i++) {
        const Point p = route[i];
        const DirectionSet along = route_connections(route, i);

        if (opt.skip_existing_roads && g.is_road_at(p.x, p.y)) {
            for (auto d : along.to_vector()) {
                if (upgrade_neighbor(g, r, step(p, d), opposite(d))) result.tiles_upgraded++;
            }
            continue;
        }

        DirectionSet wanted = along.united(adjacent_road_connections(g, p));
        if (wanted.empty()) wanted = {Direction::East, Direction::West};

        auto tile = r.find_exact_match(wanted);
        if (!tile) {
            result.unresolved.push_back({p, wanted, Error::NoMatchingConnectivity,
                                         std::format("no road tile for connections {} at ({}, {})",
                                                     to_string(wanted), p.x, p.y)});
            continue;
        }

        Error err = g.set_tile(p.x, p.y, *tile, Layer::Ground);
        if (err != Error::None) {
            result.unresolved.push_back(
                {p, wanted, err, std::format("cannot place at ({}, {}): {}", p.x, p.y, to_string(err))});
            continue;
        }
        result.tiles_placed++;
        result.placed.push_back({p, *tile, wanted});

        for (auto d : wanted.to_vector()) {
            if (upgrade_neighbor(g, r, step(p, d), opposite(d))) result.tiles_upgraded++;
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// Session policy
// ---------------------------------------------------------------------------

bool touches_road(const grid::Grid& g, Point p) {
    if (g.is_road_at(p.x, p.y)) return true;
    for (auto d : all_directions) {
        Point n = step(p, d);
        if (g.is_road_at(n.x, n.y)) return true;
    }
    return false;
}

std::optional<NearestRoad> nearest_road(const grid::Grid& g, Point p) {
    std::optional<NearestRoad> best;
    for (int y = 0; y < g.height(); y++) {
        for (int x = 0; x < g.width(); x++) {
            if (!g.is_road_at(x, y)) continue;
            int d = manhattan(p, {x, y});
            if (!best || d < best->distance) best = NearestRoad{{x, y}, d};
        }
    }
    return best;
}

DrawResult draw_road(grid::Grid& g, const connectivity::Resolver& r, RoadSession& session, Point from, Point to) {
    DrawResult res;
    res.budget_remaining = session.budget_remaining();

    if (!g.in_bounds(from.x, from.y) || !g.in_bounds(to.x, to.y)) {
        res.error = Error::OutOfBounds;
        res.message = std::format("coordinates out of bounds, map is {}x{}", g.width(), g.height());
        return res;
    }

    if (g.has_road() && !touches_road(g, from) && !touches_road(g, to)) {
        res.error = Error::DisconnectedPlacement;
        res.message = std::format("road must connect to the existing network, start ({}, {}) and end ({}, {}) are "
                                  "both disconnected",
                                  from.x, from.y, to.x, to.y);
        auto a = nearest_road(g, from);
        auto b = nearest_road(g, to);
        std::optional<NearestRoad> pick = a;
        if (b && (!a || b->distance < a->distance)) pick = b;
        if (pick)
            res.suggestion =
                std::format("start from or end at ({}, {}) which is on an existing road", pick->at.x, pick->at.y);
        return res;
    }

    const int needed = manhattan(from, to) + 1;
    if (needed > session.budget_remaining()) {
        res.error = Error::BudgetExceeded;
        res.message = std::format("road needs {} tiles but only {} remain", needed, session.budget_remaining());
        return res;
    }

    res.placement = place_path(g, r, from, to);
    session.tiles_placed += res.placement.tiles_placed;
    for (const auto& t : res.placement.placed) session.road_tiles.insert(t.at);
    res.budget_remaining = session.budget_remaining();
    if (!res.placement.ok())
        res.message = std::format("{} cell(s) could not be resolved", res.placement.unresolved.size());
    return res;
}

PlaceRoadResult place_road(grid::Grid& g, const connectivity::Resolver& r, RoadSession& session, Point at,
                           std::string_view tile_id) {
    PlaceRoadResult res;
    res.budget_remaining = session.budget_remaining();

    if (!g.in_bounds(at.x, at.y)) {
        res.error = Error::OutOfBounds;
        res.message =
            std::format("position ({}, {}) is out of bounds, map is {}x{}", at.x, at.y, g.width(), g.height());
        return res;
    }
    if (session.budget_remaining() <= 0) {
        res.error = Error::BudgetExceeded;
        res.message = std::format("road budget exhausted, max {} tiles", session.max_tiles);
        return res;
    }

    const auto& cat = g.catalog();
    auto tile = cat.find(tile_id);
    if (!tile) {
        res.error = Error::UnknownTile;
        res.message = std::format("unknown tile \"{}\"", tile_id);
        for (auto id : r.road_tiles()) {
            if (res.available.size() >= 8) break;
            res.available.push_back(cat.at(id).id);
        }
        return res;
    }
    if (!r.is_road(*tile)) {
        res.error = Error::NotARoadTile;
        res.message = std::format("\"{}\" is not a road tile", tile_id);
        return res;
    }

    const DirectionSet connects = cat.at(*tile).connectivity.connects;
    const DirectionSet expected = adjacent_road_connections(g, at);
    for (auto d : expected.to_vector()) {
        if (!connects.contains(d)) res.missing.insert(d);
    }
    if (!res.missing.empty()) {
        res.error = Error::ConnectivityMismatch;
        res.message = std::format("\"{}\" connects {} but adjacent roads need {}", tile_id, to_string(connects),
                                  to_string(expected));
        if (auto fit = r.find_exact_match(expected))
            res.suggestion = std::format("try \"{}\" instead", cat.at(*fit).id);
        return res;
    }

    for (auto d : connects.to_vector()) {
        Point n = step(at, d);
        const auto* def = g.definition_at(n.x, n.y, Layer::Ground);
        if (def && !catalog::is_road_type(def->connectivity.type))
            res.warnings.push_back(
                std::format("connection {} points to non-road tile \"{}\"", to_string(d), def->id));
    }

    Error err = g.set_tile(at.x, at.y, *tile, Layer::Ground);
    if (err != Error::None) {
        res.error = err;
        res.message = std::format("cannot place: {}", to_string(err));
        return res;
    }
    session.tiles_placed++;
    session.road_tiles.insert(at);
    res.budget_remaining = session.budget_remaining();
    return res;
}

} // namespace tileforge::roads
