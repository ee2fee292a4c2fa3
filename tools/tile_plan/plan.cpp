#include "plan.h"

#include <tileforge/placement.h>
#include <tileforge/roadnet.h>

#include <format>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace tf = tileforge;

Plan read_plan(std::istream& r) {
    try {
        json root = json::parse(r);
        Plan plan;
        if (root.contains("width")) plan.width = root.at("width").get<int>();
        if (root.contains("height")) plan.height = root.at("height").get<int>();
        if (root.contains("actions")) {
            for (const auto& a : root.at("actions")) {
                if (!a.is_object() || !a.contains("action"))
                    throw std::runtime_error("plan: every action needs an \"action\" field");
                plan.actions.push_back(a);
            }
        }
        return plan;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("plan: {}", e.what()));
    }
}

static tf::Point point_field(const json& a, const char* key) {
    const auto& v = a.at(key);
    if (v.is_array() && v.size() == 2) return {v[0].get<int>(), v[1].get<int>()};
    if (v.is_object()) return {v.at("x").get<int>(), v.at("y").get<int>()};
    throw std::runtime_error(std::format("plan: \"{}\" must be [x, y] or {{\"x\", \"y\"}}", key));
}

static std::optional<tf::Layer> layer_field(const json& a) {
    if (!a.contains("layer")) return std::nullopt;
    auto s = a.at("layer").get<std::string>();
    auto layer = tf::parse_layer(s);
    if (!layer) throw std::runtime_error(std::format("plan: unknown layer \"{}\"", s));
    return layer;
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty()) out += ", ";
        out += s;
    }
    return out;
}

static std::string failure(tf::Error e, const std::string& message) {
    return std::format("{}: {}", tf::to_string(e), message);
}

PlanRunner::PlanRunner(tf::grid::Grid& g, const tf::connectivity::Resolver& r, int road_budget)
    : grid_(g), resolver_(r) {
    session_.max_tiles = road_budget;
}

ActionOutcome PlanRunner::run(const json& a) {
    ActionOutcome out;
    out.action = a.at("action").get<std::string>();

    try {
        if (out.action == "fill_ground") {
            tf::placement::Region region{a.at("x1").get<int>(), a.at("y1").get<int>(), a.at("x2").get<int>(),
                                         a.at("y2").get<int>()};
            auto res = tf::placement::fill_ground(grid_, region, a.at("tileId").get<std::string>(),
                                                  a.value("overwrite", false));
            out.ok = res.success();
            if (out.ok) {
                out.summary = std::format("filled {}, skipped {}", res.tiles_filled, res.tiles_skipped);
            } else {
                out.summary = failure(res.error, res.message);
                if (!res.suggestions.empty()) out.summary += std::format(" (try: {})", join(res.suggestions));
            }
        } else if (out.action == "place_asset") {
            tf::Point at{a.at("x").get<int>(), a.at("y").get<int>()};
            auto res = tf::placement::place_asset(grid_, at, a.at("tileId").get<std::string>(), layer_field(a));
            out.ok = res.success();
            out.summary =
                out.ok ? std::format("{} at ({}, {})", res.tile_id, at.x, at.y) : failure(res.error, res.message);
            if (!res.suggestions.empty()) out.summary += std::format(" (try: {})", join(res.suggestions));
        } else if (out.action == "place_assets") {
            std::vector<tf::placement::AssetRequest> requests;
            for (const auto& p : a.at("placements")) {
                requests.push_back({{p.at("x").get<int>(), p.at("y").get<int>()}, p.at("tileId").get<std::string>(),
                                    layer_field(p)});
            }
            auto res = tf::placement::place_assets(grid_, requests);
            out.ok = res.success();
            out.summary = std::format("placed {}, failed {}", res.placed, res.failed);
            for (const auto& r : res.results) {
                if (!r.success())
                    out.summary += std::format("; {} at ({}, {}): {}", r.tile_id, r.at.x, r.at.y, r.message);
            }
        } else if (out.action == "draw_road") {
            auto res = tf::roads::draw_road(grid_, resolver_, session_, point_field(a, "from"), point_field(a, "to"));
            out.ok = res.success();
            if (res.error != tf::Error::None) {
                out.summary = failure(res.error, res.message);
                if (!res.suggestion.empty()) out.summary += std::format(" ({})", res.suggestion);
            } else {
                out.summary = std::format("placed {}, upgraded {}, budget left {}", res.placement.tiles_placed,
                                          res.placement.tiles_upgraded, res.budget_remaining);
                for (const auto& e : res.placement.unresolved) {
                    out.summary += std::format("; unresolved ({}, {}) {}", e.at.x, e.at.y, tf::to_string(e.required));
                }
            }
        } else if (out.action == "place_road") {
            tf::Point at{a.at("x").get<int>(), a.at("y").get<int>()};
            auto res = tf::roads::place_road(grid_, resolver_, session_, at, a.at("tileId").get<std::string>());
            out.ok = res.success();
            if (out.ok) {
                out.summary = std::format("{} at ({}, {}), budget left {}", a.at("tileId").get<std::string>(), at.x,
                                          at.y, res.budget_remaining);
            } else {
                out.summary = failure(res.error, res.message);
                if (!res.suggestion.empty()) out.summary += std::format(" ({})", res.suggestion);
                if (!res.available.empty()) out.summary += std::format(" (available: {})", join(res.available));
            }
            for (const auto& w : res.warnings) out.summary += std::format("; {}", w);
        } else if (out.action == "connect_roads") {
            auto res = tf::roadnet::repair(grid_, resolver_);
            out.ok = res.success;
            out.summary = std::format("islands {} -> {}, placed {}, upgraded {}", res.previous_island_count,
                                      res.final_island_count, res.tiles_placed, res.tiles_upgraded);
        } else if (out.action == "clear") {
            tf::Point at{a.at("x").get<int>(), a.at("y").get<int>()};
            auto layer = layer_field(a).value_or(tf::Layer::Object);
            out.ok = grid_.in_bounds(at.x, at.y);
            if (out.ok) grid_.clear_tile(at.x, at.y, layer);
            out.summary = std::format("{} {} at ({}, {})", out.ok ? "cleared" : "out of bounds", tf::to_string(layer),
                                      at.x, at.y);
        } else {
            throw std::runtime_error(std::format("plan: unknown action \"{}\"", out.action));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::format("plan: {}: {}", out.action, e.what()));
    }
    return out;
}
