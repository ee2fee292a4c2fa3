#include <tileforge/catalog.h>
#include <tileforge/connectivity.h>
#include <tileforge/grid.h>
#include <tileforge/roadnet.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace tf = tileforge;
using json = nlohmann::ordered_json;

static json point_json(tf::Point p) { return {p.x, p.y}; }

static json build_report_json(const tf::grid::Grid& g, const tf::roadnet::Report& rep) {
    const auto stats = g.stats();
    json islands = json::array();
    for (const auto& isl : rep.islands) {
        json tiles = json::array();
        for (const auto& p : isl.tiles) tiles.push_back(point_json(p));
        islands.push_back({
            {"size", isl.tiles.size()},
            {"bounds", {{"minX", isl.bounds.min_x}, {"maxX", isl.bounds.max_x},
                        {"minY", isl.bounds.min_y}, {"maxY", isl.bounds.max_y}}},
            {"tiles", tiles},
        });
    }
    return {
        {"width", g.width()},
        {"height", g.height()},
        {"stats", {{"totalCells", stats.total_cells},
                   {"groundFilled", stats.ground_filled},
                   {"objectsFilled", stats.objects_filled}}},
        {"roads", {{"connected", rep.connected},
                   {"totalTiles", rep.total_tiles},
                   {"islandCount", rep.island_count},
                   {"islands", islands}}},
    };
}

// list_tiles prints the catalog grouped by connectivity type. A non-empty
// filter keeps tiles whose description mentions any of its words.
static void list_tiles(const tf::catalog::Catalog& cat, const std::string& filter) {
    using CT = tf::catalog::ConnectivityType;
    std::cout << "Catalog: " << cat.theme() << " (" << cat.size() << " tiles, " << cat.tile_size() << "px)\n";
    for (auto type : {CT::None, CT::Path, CT::Corner, CT::Intersection, CT::Cap, CT::Edge}) {
        auto ids = cat.by_connectivity(type);
        if (!filter.empty()) ids = cat.filter_by_description(ids, filter);
        if (ids.empty()) continue;
        std::cout << tf::catalog::to_string(type) << " (" << ids.size() << "):\n";
        for (auto id : ids) {
            const auto& def = cat.at(id);
            std::cout << std::format("  {:<14} {:<9} {:<20} {}\n", def.id, tf::catalog::to_string(def.category),
                                     def.connectivity.connects.empty() ? "-" : tf::to_string(def.connectivity.connects),
                                     def.description);
        }
    }
}

static void print_usage() {
    std::cerr << "Usage: tile_check [flags] <catalog.json> <map.json>\n"
              << "       tile_check --list-tiles [-filter <words>] <catalog.json>\n\n"
              << "Prints the layers of a map and checks road connectivity.\n"
              << "Exits with status 2 when the road network is disconnected.\n\n"
              << "Flags:\n"
              << "  --json         Write the report as JSON to stdout\n"
              << "  --pretty       Pretty-print JSON output\n"
              << "  --repair       Connect road islands (requires -o)\n"
              << "  -o <path>      Output map for --repair\n"
              << "  --list-tiles   List catalog tiles by connectivity type and exit\n"
              << "  -filter <w>    With --list-tiles, match descriptions against these words\n"
              << "  --permissive   Accept connectivity descriptors that fail validation\n"
              << "  -v, --verbose  Enable verbose logging\n"
              << "  -vv, --debug   Enable debug logging\n";
}

int main(int argc, char* argv[]) {
    bool json_stdout = false;
    bool pretty = false;
    bool do_repair = false;
    bool permissive = false;
    bool list_only = false;
    std::string filter;
    std::string output_path;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--json") == 0) json_stdout = true;
        else if (std::strcmp(argv[i], "--pretty") == 0) pretty = true;
        else if (std::strcmp(argv[i], "--repair") == 0) do_repair = true;
        else if (std::strcmp(argv[i], "--permissive") == 0) permissive = true;
        else if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) output_path = argv[++i];
        else if (std::strcmp(argv[i], "--list-tiles") == 0) list_only = true;
        else if (std::strcmp(argv[i], "-filter") == 0 && i + 1 < argc) filter = argv[++i];
        else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose") == 0)
            verbosity = std::min(verbosity + 1, 2);
        else if (std::strcmp(argv[i], "-vv") == 0 || std::strcmp(argv[i], "--debug") == 0)
            verbosity = 2;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage();
            return 0;
        } else {
            positional.push_back(argv[i]);
        }
    }

    tf::log::set_verbosity(verbosity);

    if (positional.empty() || (!list_only && positional.size() < 2) || (do_repair && output_path.empty())) {
        print_usage();
        return 1;
    }

    try {
        tf::catalog::LoadOptions load_opts{.strict_connectivity = !permissive};
        auto cat = tf::catalog::load_file(positional[0], load_opts);
        if (list_only) {
            list_tiles(cat, filter);
            return 0;
        }

        std::ifstream mf(positional[1]);
        if (!mf) throw std::runtime_error(std::format("cannot open {}", positional[1]));
        auto grid = tf::grid::from_map_data(tf::grid::read_map(mf), cat);
        LOGI("Loaded", positional[1], std::format("{}x{}", grid.width(), grid.height()));

        if (do_repair) {
            tf::connectivity::Resolver resolver(cat);
            auto rep = tf::roadnet::repair(grid, resolver);
            LOGI("Repair: islands", rep.previous_island_count, "->", rep.final_island_count);
            for (const auto& b : rep.bridges) {
                LOGD("Bridge", std::format("({}, {}) -> ({}, {})", b.from.x, b.from.y, b.to.x, b.to.y), "distance",
                     b.distance);
            }
            for (const auto& e : rep.errors) LOGW("Unresolved", e.message);

            std::ofstream out(output_path);
            if (!out) throw std::runtime_error(std::format("creating {}", output_path));
            tf::grid::write_map(out, tf::grid::to_map_data(grid), pretty);
            std::cerr << "Wrote: " << output_path << " (placed " << rep.tiles_placed << ", upgraded "
                      << rep.tiles_upgraded << ")\n";
        }

        const auto report = tf::roadnet::validate(grid);

        if (json_stdout) {
            auto doc = build_report_json(grid, report);
            if (pretty) std::cout << std::setw(2) << doc << '\n';
            else std::cout << doc << '\n';
        } else {
            const auto view = tf::grid::to_ascii(grid);
            const auto stats = grid.stats();
            std::cout << "Ground layer:\n" << view.ground << '\n';
            std::cout << "Object layer:\n" << view.objects << '\n';
            std::cout << "Ground: " << stats.ground_filled << "/" << stats.total_cells
                      << ", Objects: " << stats.objects_filled << '\n';
            std::cout << "Roads: " << report.total_tiles << " tiles in " << report.island_count << " island(s), "
                      << (report.connected ? "connected" : "DISCONNECTED") << '\n';
            for (size_t i = 0; i < report.islands.size() && report.islands.size() > 1; i++) {
                const auto& b = report.islands[i].bounds;
                std::cout << "  island " << i + 1 << ": " << report.islands[i].tiles.size() << " tiles, x "
                          << b.min_x << ".." << b.max_x << ", y " << b.min_y << ".." << b.max_y << '\n';
            }
        }
        return report.connected ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
