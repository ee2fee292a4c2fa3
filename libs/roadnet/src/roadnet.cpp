#include "tileforge/roadnet.h"

#include <algorithm>
#include <cstdint>
#include <deque>

namespace tileforge::roadnet {

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

std::vector<Point> road_positions(const grid::Grid& g) {
    std::vector<Point> out;
    for (int y = 0; y < g.height(); y++) {
        for (int x = 0; x < g.width(); x++) {
            if (g.is_road_at(x, y)) out.push_back({x, y});
        }
    }
    return out;
}

static Bounds bounds_of(const std::vector<Point>& tiles) {
    Bounds b{tiles.front().x, tiles.front().x, tiles.front().y, tiles.front().y};
    for (const auto& p : tiles) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

std::vector<Island> islands(const grid::Grid& g) {
    const int w = g.width();
    const int h = g.height();
    auto idx = [w](Point p) { return static_cast<size_t>(p.y) * static_cast<size_t>(w) + static_cast<size_t>(p.x); };

    std::vector<uint8_t> road(static_cast<size_t>(w) * static_cast<size_t>(h), 0);
    const auto seeds = road_positions(g);
    for (const auto& p : seeds) road[idx(p)] = 1;

    std::vector<uint8_t> visited(road.size(), 0);
    std::vector<Island> out;
    std::deque<Point> queue;

    for (const auto& seed : seeds) {
        if (visited[idx(seed)]) continue;

        Island island;
        visited[idx(seed)] = 1;
        queue.push_back(seed);
        while (!queue.empty()) {
            Point cur = queue.front();
            queue.pop_front();
            island.tiles.push_back(cur);

            for (auto d : all_directions) {
                Point n = step(cur, d);
                if (!g.in_bounds(n.x, n.y)) continue;
                if (!road[idx(n)] || visited[idx(n)]) continue;
                visited[idx(n)] = 1;
                queue.push_back(n);
            }
        }
        island.bounds = bounds_of(island.tiles);
        out.push_back(std::move(island));
    }
    return out;
}

Report validate(const grid::Grid& g) {
    Report rep;
    rep.islands = islands(g);
    rep.island_count = static_cast<int>(rep.islands.size());
    for (const auto& isl : rep.islands) rep.total_tiles += static_cast<int>(isl.tiles.size());
    rep.connected = rep.island_count <= 1;
    return rep;
}

// ---------------------------------------------------------------------------
// Repair
// ---------------------------------------------------------------------------

std::optional<Bridge> nearest_pair(const Island& a, const Island& b) {
    std::optional<Bridge> best;
    for (const auto& p : a.tiles) {
        for (const auto& q : b.tiles) {
            int d = manhattan(p, q);
            if (!best || d < best->distance) best = Bridge{p, q, d};
        }
    }
    return best;
}

RepairResult repair(grid::Grid& g, const connectivity::Resolver& r) {
    RepairResult res;
    const Report before = validate(g);
    res.previous_island_count = before.island_count;

    if (before.connected) {
        res.success = true;
        res.already_connected = true;
        res.final_island_count = before.island_count;
        return res;
    }

    const roads::PlaceOptions opt{.skip_existing_roads = true};
    for (size_t i = 1; i < before.islands.size(); i++) {
        auto bridge = nearest_pair(before.islands[i - 1], before.islands[i]);
        if (!bridge) continue;

        auto placed = roads::place_path(g, r, bridge->from, bridge->to, opt);
        res.tiles_placed += placed.tiles_placed;
        res.tiles_upgraded += placed.tiles_upgraded;
        res.errors.insert(res.errors.end(), placed.unresolved.begin(), placed.unresolved.end());
        res.bridges.push_back(*bridge);
    }

    const Report after = validate(g);
    res.final_island_count = after.island_count;
    res.success = after.connected;
    return res;
}

} // namespace tileforge::roadnet
