#pragma once

#include <tileforge/catalog.h>
#include <tileforge/connectivity.h>
#include <tileforge/core.h>
#include <tileforge/grid.h>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tileforge::roads {

// manhattan_route walks horizontally to to.x along from.y, then vertically to
// to.y. Both endpoints are included; identical endpoints give one point.
std::vector<Point> manhattan_route(Point from, Point to);

// route_connections returns the directions from route[i] to its route
// predecessor and successor.
DirectionSet route_connections(const std::vector<Point>& route, size_t i);

// adjacent_road_connections returns the directions of neighboring road tiles
// that connect back toward p.
DirectionSet adjacent_road_connections(const grid::Grid& g, Point p);

// upgrade_neighbor widens the road tile at p so it also connects toward.
// Returns true when the tile was replaced.
bool upgrade_neighbor(grid::Grid& g, const connectivity::Resolver& r, Point p, Direction toward);

struct PlacedTile {
    Point at;
    catalog::TileId tile;
    DirectionSet connects;
};

// CellError records a route point that could not be written.
struct CellError {
    Point at;
    DirectionSet required;
    Error error = Error::None;
    std::string message;
};

struct PlaceOptions {
    // Leave route points that already hold a road untouched (repair mode).
    bool skip_existing_roads = false;
};

struct PlaceResult {
    int tiles_placed = 0;
    int tiles_upgraded = 0;
    std::vector<PlacedTile> placed;
    std::vector<CellError> unresolved;

    bool ok() const { return unresolved.empty(); }
};

// place_path lays a connected road along the Manhattan route and upgrades
// adjacent roads into corners and junctions. Unresolvable cells are skipped
// and reported; the rest of the route is still placed.
PlaceResult place_path(grid::Grid& g, const connectivity::Resolver& r, Point from, Point to,
                       const PlaceOptions& opt = {});

// ---------------------------------------------------------------------------
// Session policy
// ---------------------------------------------------------------------------

// RoadSession carries the road budget and placement history of one
// generation run. Create one per run and pass it to every call.
struct RoadSession {
    int max_tiles = 0;
    int tiles_placed = 0;
    std::set<Point> road_tiles;

    int budget_remaining() const { return max_tiles > tiles_placed ? max_tiles - tiles_placed : 0; }
};

struct NearestRoad {
    Point at;
    int distance = 0;
};

// touches_road reports whether p is a road tile or 4-adjacent to one.
bool touches_road(const grid::Grid& g, Point p);
std::optional<NearestRoad> nearest_road(const grid::Grid& g, Point p);

struct DrawResult {
    Error error = Error::None; // rejection reason; nothing was written unless None
    std::string message;
    std::string suggestion;
    PlaceResult placement;
    int budget_remaining = 0;

    bool success() const { return error == Error::None && placement.ok(); }
};

// draw_road applies bounds, connection gating and budget checks, then runs
// place_path. Once the grid holds any road, one endpoint must touch it.
DrawResult draw_road(grid::Grid& g, const connectivity::Resolver& r, RoadSession& session, Point from, Point to);

struct PlaceRoadResult {
    Error error = Error::None;
    std::string message;
    std::string suggestion;
    DirectionSet missing;                 // ConnectivityMismatch only
    std::vector<std::string> available;   // UnknownTile only
    std::vector<std::string> warnings;
    int budget_remaining = 0;

    bool success() const { return error == Error::None; }
};

// place_road writes an explicitly chosen road tile after checking that it
// connects back to every adjacent road pointing at it.
PlaceRoadResult place_road(grid::Grid& g, const connectivity::Resolver& r, RoadSession& session, Point at,
                           std::string_view tile_id);

} // namespace tileforge::roads
