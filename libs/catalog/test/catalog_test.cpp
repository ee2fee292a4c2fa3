#include "tileforge/catalog.h"

#include "sample_catalog.h"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>

using namespace tileforge;
using namespace tileforge::catalog;

static Catalog load_str(const std::string& s, const LoadOptions& opt = {}) {
    std::istringstream in(s);
    return load(in, opt);
}

TEST(Catalog, LoadsSampleSheet) {
    auto cat = tileforge::testing::sample_catalog();
    EXPECT_EQ(cat.theme(), "test village");
    EXPECT_EQ(cat.tile_size(), 4);
    EXPECT_EQ(cat.columns(), 8);
    EXPECT_EQ(cat.rows(), 5);
    EXPECT_EQ(cat.size(), 23u);
    EXPECT_EQ(cat.scene_description(), "A compact village with dirt roads.");

    auto house = cat.find("house");
    ASSERT_TRUE(house.has_value());
    const auto& def = cat.at(*house);
    EXPECT_EQ(def.category, Category::Building);
    EXPECT_EQ(def.footprint.w, 2);
    EXPECT_EQ(def.footprint.h, 2);
    EXPECT_EQ(def.placement.layer, Layer::Object);
    EXPECT_FALSE(def.placement.walkable);
    EXPECT_EQ(def.placement.anchor, Anchor::BottomCenter);
}

TEST(Catalog, AppliesDefaults) {
    auto cat = tileforge::testing::sample_catalog();
    const auto& grass = cat.at(*cat.find("grass"));
    EXPECT_EQ(grass.footprint.w, 1);
    EXPECT_EQ(grass.footprint.h, 1);
    EXPECT_EQ(grass.placement.layer, Layer::Ground);
    EXPECT_TRUE(grass.placement.walkable);
    EXPECT_EQ(grass.placement.anchor, Anchor::TopLeft);
    EXPECT_EQ(grass.connectivity.type, ConnectivityType::None);
    EXPECT_TRUE(grass.connectivity.connects.empty());
    EXPECT_FALSE(grass.is_road());
    EXPECT_TRUE(grass.variants.empty());
}

TEST(Catalog, ReadsVariants) {
    auto cat = load_str(R"({"tileSize": 16, "sprites": [
        {"id": "oak", "category": "prop", "variants": ["oak_autumn", "oak_bare"]}]})");
    const auto& oak = cat.at(*cat.find("oak"));
    ASSERT_EQ(oak.variants.size(), 2u);
    EXPECT_EQ(oak.variants[1], "oak_bare");
}

TEST(Catalog, EdgeKeepsContentSide) {
    auto cat = tileforge::testing::sample_catalog();
    const auto& edge = cat.at(*cat.find("water_edge"));
    EXPECT_EQ(edge.connectivity.type, ConnectivityType::Edge);
    ASSERT_TRUE(edge.connectivity.content_side.has_value());
    EXPECT_EQ(*edge.connectivity.content_side, Direction::South);
    EXPECT_FALSE(edge.is_road());
}

TEST(Catalog, Queries) {
    auto cat = tileforge::testing::sample_catalog();

    EXPECT_EQ(cat.by_category(Category::Prop).size(), 2u);
    EXPECT_EQ(cat.by_connectivity(ConnectivityType::Cap).size(), 4u);
    EXPECT_EQ(cat.road_tiles().size(), 15u);

    auto ew = cat.with_connections({Direction::East, Direction::West});
    ASSERT_EQ(ew.size(), 2u); // road_h and water_edge
    EXPECT_EQ(cat.at(ew[0]).id, "road_h");
    EXPECT_EQ(cat.at(ew[1]).id, "water_edge");

    auto all = cat.by_category(Category::Ground);
    auto hits = cat.filter_by_description(all, "GRASS shoreline");
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(cat.at(hits[0]).id, "water_edge");
    EXPECT_EQ(cat.at(hits[1]).id, "grass");
}

TEST(Catalog, SuggestRespectsOrderAndLimit) {
    auto cat = tileforge::testing::sample_catalog();
    auto s = cat.suggest({Category::Building, Category::Prop, Category::Marker}, 3);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0], "house");
    EXPECT_EQ(s[1], "tree");
    EXPECT_EQ(s[2], "bench");
}

TEST(Catalog, ValidateConnectivityArity) {
    using CT = ConnectivityType;
    EXPECT_TRUE(validate_connectivity({CT::Path, {Direction::North, Direction::South}, {}}).empty());
    EXPECT_FALSE(validate_connectivity({CT::Path, {Direction::North, Direction::East}, {}}).empty());
    EXPECT_TRUE(validate_connectivity({CT::Corner, {Direction::North, Direction::East}, {}}).empty());
    EXPECT_FALSE(validate_connectivity({CT::Corner, {Direction::East, Direction::West}, {}}).empty());
    EXPECT_FALSE(validate_connectivity({CT::Intersection, {Direction::East, Direction::West}, {}}).empty());
    EXPECT_TRUE(validate_connectivity({CT::Cap, {Direction::West}, {}}).empty());
    EXPECT_FALSE(validate_connectivity({CT::Cap, {}, {}}).empty());
    EXPECT_FALSE(validate_connectivity({CT::None, {Direction::West}, {}}).empty());
    EXPECT_TRUE(validate_connectivity({CT::Edge, {}, Direction::North}).empty());
}

static const char* kBadCorner = R"({"tileSize": 8, "sprites": [
    {"id": "bad", "category": "ground", "connectivity": {"type": "corner", "connects": ["east", "west"]}}]})";

TEST(Catalog, StrictModeRejectsMismatchedDescriptors) {
    EXPECT_THROW(load_str(kBadCorner), std::runtime_error);
}

TEST(Catalog, PermissiveModeAcceptsMismatchedDescriptors) {
    auto cat = load_str(kBadCorner, {.strict_connectivity = false});
    ASSERT_EQ(cat.size(), 1u);
    EXPECT_EQ(cat.at({0}).connectivity.type, ConnectivityType::Corner);
}

TEST(Catalog, AcceptsTilesKey) {
    auto cat = load_str(R"({"tileSize": 16, "tiles": [{"id": "a", "category": "prop"}]})");
    EXPECT_EQ(cat.size(), 1u);
    EXPECT_TRUE(cat.find("a").has_value());
}

TEST(Catalog, RejectsMalformedInput) {
    EXPECT_THROW(load_str("{not json"), std::runtime_error);
    EXPECT_THROW(load_str(R"({"sprites": []})"), std::runtime_error); // no tileSize
    EXPECT_THROW(load_str(R"({"tileSize": 4, "sprites": [{"category": "ground"}]})"), std::runtime_error);
    EXPECT_THROW(load_str(R"({"tileSize": 4, "sprites": [{"id": "x", "category": "cloud"}]})"), std::runtime_error);
    EXPECT_THROW(load_str(R"({"tileSize": 4, "sprites": [{"id": "x", "category": "ground",
        "connectivity": {"type": "cap", "connects": ["up"]}}]})"),
                 std::runtime_error);
}

TEST(Catalog, RejectsDuplicateIds) {
    EXPECT_THROW(load_str(R"({"tileSize": 4, "sprites": [
        {"id": "x", "category": "ground"}, {"id": "x", "category": "prop"}]})"),
                 std::runtime_error);
}

TEST(Catalog, RejectsSpritesOutsideAtlas) {
    EXPECT_THROW(load_str(R"({"tileSize": 4, "columns": 2, "rows": 2, "sprites": [
        {"id": "big", "category": "building", "col": 1, "row": 0, "w": 2, "h": 1}]})"),
                 std::runtime_error);
}

TEST(Catalog, LoadFileMissing) {
    EXPECT_THROW(load_file("/nonexistent/tileforge/catalog.json"), std::runtime_error);
}
