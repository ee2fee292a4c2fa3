#pragma once

#include <tileforge/connectivity.h>
#include <tileforge/grid.h>
#include <tileforge/roads.h>

#include <nlohmann/json.hpp>

#include <istream>
#include <optional>
#include <string>
#include <vector>

// A plan is a scripted list of placement actions:
//
//   {"width": 12, "height": 12,
//    "actions": [
//      {"action": "fill_ground", "x1": 0, "y1": 0, "x2": 11, "y2": 11, "tileId": "grass"},
//      {"action": "draw_road", "from": [0, 5], "to": [11, 5]},
//      {"action": "place_road", "x": 4, "y": 6, "tileId": "road_v"},
//      {"action": "place_asset", "x": 2, "y": 2, "tileId": "house", "layer": "objects"},
//      {"action": "place_assets", "placements": [{"x": 3, "y": 3, "tileId": "tree"}]},
//      {"action": "connect_roads"},
//      {"action": "clear", "x": 2, "y": 2, "layer": "objects"}]}

struct Plan {
    std::optional<int> width;
    std::optional<int> height;
    std::vector<nlohmann::ordered_json> actions;
};

// read_plan throws std::runtime_error on malformed JSON.
Plan read_plan(std::istream& r);

struct ActionOutcome {
    std::string action;
    bool ok = false;
    std::string summary;
};

// PlanRunner executes plan actions against one grid and road session.
class PlanRunner {
public:
    PlanRunner(tileforge::grid::Grid& g, const tileforge::connectivity::Resolver& r, int road_budget);

    // run executes one action. Unknown actions and bad fields throw
    // std::runtime_error; placement failures are reported in the outcome.
    ActionOutcome run(const nlohmann::ordered_json& action);

    const tileforge::roads::RoadSession& session() const { return session_; }

private:
    tileforge::grid::Grid& grid_;
    const tileforge::connectivity::Resolver& resolver_;
    tileforge::roads::RoadSession session_;
};
