#include "tileforge/roads.h"

#include "sample_catalog.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace tileforge;
using namespace tileforge::roads;

class RoadsTest : public ::testing::Test {
protected:
    catalog::Catalog cat = tileforge::testing::sample_catalog();
    connectivity::Resolver resolver{cat};

    std::string ground_id(const grid::Grid& g, int x, int y) const {
        const auto* def = g.definition_at(x, y, Layer::Ground);
        return def ? def->id : ".";
    }

    DirectionSet connects_at(const grid::Grid& g, int x, int y) const {
        const auto* def = g.definition_at(x, y, Layer::Ground);
        return def ? def->connectivity.connects : DirectionSet{};
    }
};

// --- Route ---

TEST(ManhattanRoute, HorizontalThenVertical) {
    auto r = manhattan_route({0, 0}, {2, 2});
    std::vector<Point> want = {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}};
    EXPECT_EQ(r, want);
}

TEST(ManhattanRoute, Reverse) {
    auto r = manhattan_route({3, 2}, {1, 0});
    std::vector<Point> want = {{3, 2}, {2, 2}, {1, 2}, {1, 1}, {1, 0}};
    EXPECT_EQ(r, want);
}

TEST(ManhattanRoute, SinglePoint) {
    auto r = manhattan_route({4, 4}, {4, 4});
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0], (Point{4, 4}));
}

TEST(ManhattanRoute, Connections) {
    auto r = manhattan_route({0, 0}, {2, 2});
    EXPECT_EQ(route_connections(r, 0), (DirectionSet{Direction::East}));
    EXPECT_EQ(route_connections(r, 1), (DirectionSet{Direction::East, Direction::West}));
    EXPECT_EQ(route_connections(r, 2), (DirectionSet{Direction::West, Direction::South}));
    EXPECT_EQ(route_connections(r, 4), (DirectionSet{Direction::North}));
    EXPECT_TRUE(route_connections(r, 99).empty());
}

// --- Path placement ---

TEST_F(RoadsTest, StraightPathGetsCapsAndStraights) {
    grid::Grid g(5, 5, cat);
    auto res = place_path(g, resolver, {0, 2}, {4, 2});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.tiles_placed, 5);
    EXPECT_EQ(ground_id(g, 0, 2), "cap_e");
    EXPECT_EQ(ground_id(g, 1, 2), "road_h");
    EXPECT_EQ(ground_id(g, 3, 2), "road_h");
    EXPECT_EQ(ground_id(g, 4, 2), "cap_w");
}

TEST_F(RoadsTest, BentPathPlacesCorner) {
    grid::Grid g(5, 5, cat);
    auto res = place_path(g, resolver, {0, 0}, {2, 2});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(ground_id(g, 1, 0), "road_h");
    EXPECT_EQ(ground_id(g, 2, 0), "corner_sw");
    EXPECT_EQ(ground_id(g, 2, 1), "road_v");
    EXPECT_EQ(ground_id(g, 2, 2), "cap_n");
}

TEST_F(RoadsTest, SingleIsolatedTileDefaultsToEastWest) {
    grid::Grid g(3, 3, cat);
    auto res = place_path(g, resolver, {1, 1}, {1, 1});
    EXPECT_EQ(res.tiles_placed, 1);
    EXPECT_EQ(ground_id(g, 1, 1), "road_h");
    EXPECT_EQ(res.placed[0].connects, (DirectionSet{Direction::East, Direction::West}));
}

TEST_F(RoadsTest, ReciprocalAdjacentRoadsShareConnection) {
    grid::Grid g(6, 6, cat);
    ASSERT_TRUE(place_path(g, resolver, {0, 3}, {5, 3}).ok());
    ASSERT_TRUE(place_path(g, resolver, {2, 0}, {2, 3}).ok());

    // The vertical spur ends on the horizontal road, which widens into a junction.
    EXPECT_EQ(ground_id(g, 2, 0), "cap_s");
    EXPECT_EQ(ground_id(g, 2, 2), "road_v");
    EXPECT_EQ(ground_id(g, 2, 3), "t_north");

    for (int y = 0; y < 6; y++) {
        for (int x = 0; x < 6; x++) {
            if (!g.is_road_at(x, y)) continue;
            for (auto d : connects_at(g, x, y).to_vector()) {
                Point n = step({x, y}, d);
                if (!g.is_road_at(n.x, n.y)) continue;
                EXPECT_TRUE(connects_at(g, n.x, n.y).contains(opposite(d)))
                    << "(" << x << ", " << y << ") -> " << to_string(d);
            }
        }
    }
}

TEST_F(RoadsTest, UpgradeNeighborWidensStraight) {
    grid::Grid g(5, 5, cat);
    ASSERT_EQ(g.set_tile(2, 2, "road_h", Layer::Ground), Error::None);
    EXPECT_TRUE(upgrade_neighbor(g, resolver, {2, 2}, Direction::North));
    EXPECT_EQ(connects_at(g, 2, 2), (DirectionSet{Direction::East, Direction::West, Direction::North}));
}

TEST_F(RoadsTest, UpgradeNeighborIgnoresNonRoads) {
    grid::Grid g(3, 3, cat);
    ASSERT_EQ(g.set_tile(1, 1, "grass", Layer::Ground), Error::None);
    EXPECT_FALSE(upgrade_neighbor(g, resolver, {1, 1}, Direction::North));
    EXPECT_FALSE(upgrade_neighbor(g, resolver, {0, 0}, Direction::North));
    EXPECT_EQ(ground_id(g, 1, 1), "grass");
}

TEST_F(RoadsTest, UnresolvableCellsAreReportedAndSkipped) {
    std::istringstream in(R"({"tileSize": 4, "sprites": [
        {"id": "h", "category": "ground", "connectivity": {"type": "path", "connects": ["east", "west"]}}]})");
    auto straights = catalog::load(in);
    connectivity::Resolver limited(straights);
    grid::Grid g(4, 1, straights);

    // Endpoints want caps, which this catalog lacks; the middle still goes down.
    auto res = place_path(g, limited, {0, 0}, {3, 0});
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.tiles_placed, 2);
    ASSERT_EQ(res.unresolved.size(), 2u);
    EXPECT_EQ(res.unresolved[0].at, (Point{0, 0}));
    EXPECT_EQ(res.unresolved[0].error, Error::NoMatchingConnectivity);
    EXPECT_EQ(res.unresolved[0].required, (DirectionSet{Direction::East}));
    EXPECT_FALSE(g.get_tile(0, 0, Layer::Ground).has_value());
    EXPECT_TRUE(g.is_road_at(1, 0));
}

TEST_F(RoadsTest, SkipExistingRoadsUpgradesInsteadOfOverwriting) {
    grid::Grid g(5, 3, cat);
    ASSERT_EQ(g.set_tile(2, 1, "road_v", Layer::Ground), Error::None);
    auto res = place_path(g, resolver, {0, 1}, {4, 1}, {.skip_existing_roads = true});

    // The crossing road is widened from both sides, keeping north and south.
    EXPECT_EQ(ground_id(g, 2, 1), "cross");
    EXPECT_EQ(res.tiles_placed, 4);
    EXPECT_EQ(res.tiles_upgraded, 2);
    for (const auto& t : res.placed) EXPECT_NE(t.at, (Point{2, 1}));
}

// --- Session policy ---

TEST_F(RoadsTest, DrawRoadFirstRoadIsFree) {
    grid::Grid g(10, 10, cat);
    RoadSession s{.max_tiles = 25};
    auto res = draw_road(g, resolver, s, {0, 5}, {9, 5});
    ASSERT_TRUE(res.success()) << res.message;
    EXPECT_EQ(res.placement.tiles_placed, 10);
    EXPECT_EQ(res.budget_remaining, 15);
    EXPECT_EQ(s.road_tiles.size(), 10u);
}

TEST_F(RoadsTest, DrawRoadRejectsDisconnectedRoad) {
    grid::Grid g(10, 10, cat);
    RoadSession s{.max_tiles = 25};
    ASSERT_TRUE(draw_road(g, resolver, s, {0, 5}, {9, 5}).success());
    const auto before = grid::to_map_data(g);

    auto res = draw_road(g, resolver, s, {0, 0}, {3, 0});
    EXPECT_EQ(res.error, Error::DisconnectedPlacement);
    EXPECT_FALSE(res.suggestion.empty());
    EXPECT_EQ(grid::to_map_data(g), before);
    EXPECT_EQ(s.budget_remaining(), 15);
}

TEST_F(RoadsTest, DrawRoadBranchUpgradesJunction) {
    grid::Grid g(10, 10, cat);
    RoadSession s{.max_tiles = 25};
    ASSERT_TRUE(draw_road(g, resolver, s, {0, 5}, {9, 5}).success());

    auto res = draw_road(g, resolver, s, {4, 5}, {4, 0});
    ASSERT_TRUE(res.success()) << res.message;
    EXPECT_EQ(ground_id(g, 4, 5), "t_north");
    EXPECT_EQ(ground_id(g, 4, 4), "road_v");
    EXPECT_EQ(ground_id(g, 4, 0), "cap_s");
    EXPECT_EQ(s.budget_remaining(), 9);
}

TEST_F(RoadsTest, DrawRoadEnforcesBudget) {
    grid::Grid g(10, 10, cat);
    RoadSession s{.max_tiles = 3};
    auto res = draw_road(g, resolver, s, {0, 0}, {5, 0});
    EXPECT_EQ(res.error, Error::BudgetExceeded);
    EXPECT_EQ(res.message, "road needs 6 tiles but only 3 remain");
    EXPECT_FALSE(g.has_road());
    EXPECT_EQ(s.tiles_placed, 0);
}

TEST_F(RoadsTest, DrawRoadOutOfBounds) {
    grid::Grid g(4, 4, cat);
    RoadSession s{.max_tiles = 10};
    EXPECT_EQ(draw_road(g, resolver, s, {-1, 0}, {2, 0}).error, Error::OutOfBounds);
    auto res = draw_road(g, resolver, s, {0, 0}, {4, 0});
    EXPECT_EQ(res.error, Error::OutOfBounds);
    EXPECT_EQ(res.message, "coordinates out of bounds, map is 4x4");
}

TEST_F(RoadsTest, DrawRoadDisconnectedNamesEndpointsAndNearestRoad) {
    grid::Grid g(8, 8, cat);
    RoadSession s{.max_tiles = 20};
    ASSERT_TRUE(draw_road(g, resolver, s, {0, 0}, {3, 0}).success());

    auto res = draw_road(g, resolver, s, {0, 5}, {2, 5});
    EXPECT_EQ(res.error, Error::DisconnectedPlacement);
    EXPECT_EQ(res.message,
              "road must connect to the existing network, start (0, 5) and end (2, 5) are both disconnected");
    EXPECT_EQ(res.suggestion, "start from or end at (0, 0) which is on an existing road");
}

TEST_F(RoadsTest, NearestRoadFindsFirstMinimum) {
    grid::Grid g(6, 6, cat);
    EXPECT_FALSE(nearest_road(g, {0, 0}).has_value());
    ASSERT_EQ(g.set_tile(2, 0, "road_h", Layer::Ground), Error::None);
    ASSERT_EQ(g.set_tile(0, 2, "road_v", Layer::Ground), Error::None);
    auto n = nearest_road(g, {0, 0});
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->at, (Point{2, 0}));
    EXPECT_EQ(n->distance, 2);
    EXPECT_TRUE(touches_road(g, {1, 0}));
    EXPECT_FALSE(touches_road(g, {4, 4}));
}

TEST_F(RoadsTest, PlaceRoadAcceptsMatchingTile) {
    grid::Grid g(5, 5, cat);
    RoadSession s{.max_tiles = 5};
    auto first = place_road(g, resolver, s, {2, 2}, "road_h");
    ASSERT_TRUE(first.success()) << first.message;
    EXPECT_EQ(first.budget_remaining, 4);

    auto second = place_road(g, resolver, s, {3, 2}, "road_h");
    EXPECT_TRUE(second.success());
    EXPECT_TRUE(second.warnings.empty());
    EXPECT_EQ(s.tiles_placed, 2);
}

TEST_F(RoadsTest, PlaceRoadReportsMismatchWithSuggestion) {
    grid::Grid g(5, 5, cat);
    RoadSession s{.max_tiles = 5};
    ASSERT_TRUE(place_road(g, resolver, s, {2, 2}, "road_h").success());

    auto res = place_road(g, resolver, s, {3, 2}, "road_v");
    EXPECT_EQ(res.error, Error::ConnectivityMismatch);
    EXPECT_EQ(res.missing, (DirectionSet{Direction::West}));
    EXPECT_NE(res.suggestion.find("cap_w"), std::string::npos);
    EXPECT_FALSE(g.get_tile(3, 2, Layer::Ground).has_value());
}

TEST_F(RoadsTest, PlaceRoadWarnsAboutNonRoadNeighbors) {
    grid::Grid g(5, 5, cat);
    RoadSession s{.max_tiles = 5};
    ASSERT_EQ(g.set_tile(4, 4, "grass", Layer::Ground), Error::None);
    auto res = place_road(g, resolver, s, {3, 4}, "cap_e");
    EXPECT_TRUE(res.success());
    ASSERT_EQ(res.warnings.size(), 1u);
    EXPECT_NE(res.warnings[0].find("grass"), std::string::npos);
}

TEST_F(RoadsTest, PlaceRoadRejections) {
    grid::Grid g(5, 5, cat);
    RoadSession s{.max_tiles = 5};

    auto unknown = place_road(g, resolver, s, {0, 0}, "lava");
    EXPECT_EQ(unknown.error, Error::UnknownTile);
    ASSERT_EQ(unknown.available.size(), 8u);
    EXPECT_EQ(unknown.available[0], "road_h");

    EXPECT_EQ(place_road(g, resolver, s, {0, 0}, "grass").error, Error::NotARoadTile);
    EXPECT_EQ(place_road(g, resolver, s, {0, 0}, "water_edge").error, Error::NotARoadTile);
    EXPECT_EQ(place_road(g, resolver, s, {5, 0}, "road_h").error, Error::OutOfBounds);

    RoadSession spent{.max_tiles = 0};
    EXPECT_EQ(place_road(g, resolver, spent, {0, 0}, "road_h").error, Error::BudgetExceeded);
    EXPECT_FALSE(g.has_road());
}
