#include "tileforge/roadnet.h"

#include "sample_catalog.h"

#include <gtest/gtest.h>

#include <map>
#include <sstream>

using namespace tileforge;
using namespace tileforge::roadnet;

class RoadnetTest : public ::testing::Test {
protected:
    catalog::Catalog cat = tileforge::testing::sample_catalog();
    connectivity::Resolver resolver{cat};

    void put(grid::Grid& g, int x, int y, const char* id) {
        ASSERT_EQ(g.set_tile(x, y, id, Layer::Ground), Error::None);
    }

    DirectionSet connects_at(const grid::Grid& g, int x, int y) const {
        const auto* def = g.definition_at(x, y, Layer::Ground);
        return def ? def->connectivity.connects : DirectionSet{};
    }

    // Two three-tile east-west segments in opposite corners of an 8x8 map.
    grid::Grid opposite_corners() {
        grid::Grid g(8, 8, cat);
        for (int x = 0; x < 3; x++) put(g, x, 0, "road_h");
        for (int x = 5; x < 8; x++) put(g, x, 7, "road_h");
        return g;
    }
};

TEST_F(RoadnetTest, EmptyGridIsConnected) {
    grid::Grid g(4, 4, cat);
    auto rep = validate(g);
    EXPECT_TRUE(rep.connected);
    EXPECT_EQ(rep.island_count, 0);
    EXPECT_EQ(rep.total_tiles, 0);
}

TEST_F(RoadnetTest, SingleTileIsOneIsland) {
    grid::Grid g(4, 4, cat);
    put(g, 2, 2, "road_h");
    auto rep = validate(g);
    EXPECT_TRUE(rep.connected);
    EXPECT_EQ(rep.island_count, 1);
    EXPECT_EQ(rep.islands[0].bounds.min_x, 2);
    EXPECT_EQ(rep.islands[0].bounds.max_y, 2);
}

TEST_F(RoadnetTest, NonRoadGroundIsIgnored) {
    grid::Grid g(4, 1, cat);
    put(g, 0, 0, "road_h");
    put(g, 1, 0, "water_edge");
    put(g, 2, 0, "grass");
    put(g, 3, 0, "road_h");
    EXPECT_EQ(road_positions(g).size(), 2u);
    EXPECT_EQ(validate(g).island_count, 2);
}

TEST_F(RoadnetTest, AdjacencyIsGeometricOnly) {
    // Two road tiles next to each other form one island even if their
    // connection sets do not meet.
    grid::Grid g(3, 3, cat);
    put(g, 1, 0, "road_v");
    put(g, 2, 0, "road_v");
    EXPECT_EQ(validate(g).island_count, 1);
}

TEST_F(RoadnetTest, DiagonalTilesAreSeparateIslands) {
    grid::Grid g(3, 3, cat);
    put(g, 0, 0, "road_h");
    put(g, 1, 1, "road_h");
    auto rep = validate(g);
    EXPECT_FALSE(rep.connected);
    EXPECT_EQ(rep.island_count, 2);
}

TEST_F(RoadnetTest, OppositeCornersGiveTwoIslands) {
    auto g = opposite_corners();
    auto rep = validate(g);
    EXPECT_FALSE(rep.connected);
    EXPECT_EQ(rep.total_tiles, 6);
    ASSERT_EQ(rep.island_count, 2);

    // Seeds are row-major, so the top segment comes first.
    EXPECT_EQ(rep.islands[0].tiles.front(), (Point{0, 0}));
    EXPECT_EQ(rep.islands[0].bounds.max_x, 2);
    EXPECT_EQ(rep.islands[1].tiles.front(), (Point{5, 7}));
    EXPECT_EQ(rep.islands[1].bounds.min_x, 5);
    EXPECT_EQ(rep.islands[1].bounds.min_y, 7);
}

TEST_F(RoadnetTest, NearestPairPicksFirstMinimum) {
    auto g = opposite_corners();
    auto isl = islands(g);
    ASSERT_EQ(isl.size(), 2u);
    auto b = nearest_pair(isl[0], isl[1]);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->from, (Point{2, 0}));
    EXPECT_EQ(b->to, (Point{5, 7}));
    EXPECT_EQ(b->distance, 10);

    EXPECT_FALSE(nearest_pair(isl[0], Island{}).has_value());
}

TEST_F(RoadnetTest, RepairConnectsOppositeCorners) {
    auto g = opposite_corners();

    std::map<Point, DirectionSet> original;
    for (const auto& p : road_positions(g)) original[p] = connects_at(g, p.x, p.y);

    auto res = repair(g, resolver);
    EXPECT_TRUE(res.success);
    EXPECT_FALSE(res.already_connected);
    EXPECT_EQ(res.previous_island_count, 2);
    EXPECT_EQ(res.final_island_count, 1);
    EXPECT_TRUE(res.errors.empty());
    ASSERT_EQ(res.bridges.size(), 1u);
    EXPECT_EQ(res.tiles_placed, 9);
    EXPECT_EQ(res.tiles_upgraded, 1);

    // Existing roads are only ever widened.
    for (const auto& [p, before] : original) {
        auto now = connects_at(g, p.x, p.y);
        for (auto d : before.to_vector()) EXPECT_TRUE(now.contains(d)) << p.x << "," << p.y;
    }
    EXPECT_EQ(connects_at(g, 5, 7), (DirectionSet{Direction::North, Direction::East, Direction::West}));
    EXPECT_EQ(connects_at(g, 5, 0), (DirectionSet{Direction::South, Direction::West}));

    EXPECT_TRUE(validate(g).connected);
}

TEST_F(RoadnetTest, RepairOnConnectedNetworkIsNoOp) {
    grid::Grid g(4, 4, cat);
    put(g, 0, 0, "road_h");
    put(g, 1, 0, "road_h");
    const auto before = grid::to_map_data(g);

    auto res = repair(g, resolver);
    EXPECT_TRUE(res.success);
    EXPECT_TRUE(res.already_connected);
    EXPECT_EQ(res.tiles_placed, 0);
    EXPECT_EQ(grid::to_map_data(g), before);
}

TEST_F(RoadnetTest, RepairChainsConsecutiveIslands) {
    grid::Grid g(9, 1, cat);
    put(g, 0, 0, "road_h");
    put(g, 4, 0, "road_h");
    put(g, 8, 0, "road_h");

    auto res = repair(g, resolver);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.previous_island_count, 3);
    EXPECT_EQ(res.bridges.size(), 2u);
    EXPECT_EQ(res.tiles_placed, 6);
    EXPECT_EQ(validate(g).total_tiles, 9);
}

TEST_F(RoadnetTest, RepairReportsUnresolvedCells) {
    // Only straight pieces: the bend of the bridge cannot be resolved.
    std::istringstream in(R"({"tileSize": 4, "sprites": [
        {"id": "h", "category": "ground", "connectivity": {"type": "path", "connects": ["east", "west"]}},
        {"id": "v", "category": "ground", "connectivity": {"type": "path", "connects": ["north", "south"]}}]})");
    auto straights = catalog::load(in);
    connectivity::Resolver limited(straights);
    grid::Grid g(4, 4, straights);
    ASSERT_EQ(g.set_tile(0, 0, "h", Layer::Ground), Error::None);
    ASSERT_EQ(g.set_tile(3, 3, "v", Layer::Ground), Error::None);

    auto res = repair(g, limited);
    EXPECT_FALSE(res.success);
    EXPECT_FALSE(res.errors.empty());
    EXPECT_EQ(res.errors[0].error, Error::NoMatchingConnectivity);
    EXPECT_GT(res.final_island_count, 1);
}
