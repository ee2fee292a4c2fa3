#include "plan.h"

#include <tileforge/catalog.h>
#include <tileforge/connectivity.h>
#include <tileforge/grid.h>
#include <tileforge/roadnet.h>
#include <tileforge/settings.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace tf = tileforge;

static void print_usage() {
    std::cerr << "Usage: tile_plan [flags] <catalog.json> <plan.json> <map.json>\n\n"
              << "Builds a map by running the actions of a plan file in order.\n\n"
              << "Actions: fill_ground, place_asset, place_assets, draw_road,\n"
              << "         place_road, connect_roads, clear\n\n"
              << "Flags:\n"
              << "  -width <n>       Map width (default: plan, then settings)\n"
              << "  -height <n>      Map height (default: plan, then settings)\n"
              << "  --auto-repair    Connect road islands after the last action\n"
              << "  --permissive     Accept connectivity descriptors that fail validation\n"
              << "  --pretty         Pretty-print map JSON\n"
              << "  --ascii          Print both layers as ASCII to stdout\n"
              << "  -v, --verbose    Enable verbose logging\n"
              << "  -vv, --debug     Enable debug logging\n";
}

int main(int argc, char* argv[]) {
    int width = 0;
    int height = 0;
    bool auto_repair = false;
    bool permissive = false;
    bool pretty = false;
    bool ascii = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-width") == 0 && i + 1 < argc) width = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "-height") == 0 && i + 1 < argc) height = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "--auto-repair") == 0) auto_repair = true;
        else if (std::strcmp(argv[i], "--permissive") == 0) permissive = true;
        else if (std::strcmp(argv[i], "--pretty") == 0) pretty = true;
        else if (std::strcmp(argv[i], "--ascii") == 0) ascii = true;
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

    if (positional.size() < 3) {
        print_usage();
        return 1;
    }

    try {
        const auto settings = tf::settings::load_settings();
        LOGD("Settings from", tf::settings::settings_path().string());

        tf::catalog::LoadOptions load_opts{.strict_connectivity = !permissive};
        auto cat = tf::catalog::load_file(positional[0], load_opts);
        LOGI("Catalog", cat.theme(), "with", cat.size(), "tiles");

        std::ifstream pf(positional[1]);
        if (!pf) throw std::runtime_error(std::format("cannot open {}", positional[1]));
        auto plan = read_plan(pf);

        if (width <= 0) width = plan.width.value_or(settings.map.width);
        if (height <= 0) height = plan.height.value_or(settings.map.height);

        tf::grid::Grid grid(width, height, cat);
        tf::connectivity::Resolver resolver(cat);
        const int budget = settings.road_budget(width, height);
        LOGI("Map", std::format("{}x{}", width, height), "road budget", budget);

        PlanRunner runner(grid, resolver, budget);
        int failed = 0;
        for (size_t i = 0; i < plan.actions.size(); i++) {
            auto outcome = runner.run(plan.actions[i]);
            const std::string tag = std::format("#{} {}:", i + 1, outcome.action);
            if (outcome.ok) {
                LOGI(tag, outcome.summary);
            } else {
                failed++;
                LOGW(tag, outcome.summary);
            }
        }

        if (auto_repair) {
            auto rep = tf::roadnet::repair(grid, resolver);
            if (!rep.already_connected) {
                LOGI("Auto-repair: islands", rep.previous_island_count, "->", rep.final_island_count, "placed",
                     rep.tiles_placed, "upgraded", rep.tiles_upgraded);
            }
            for (const auto& e : rep.errors) {
                LOGW("Auto-repair could not resolve", std::format("({}, {})", e.at.x, e.at.y),
                     tf::to_string(e.required));
            }
        }

        std::ofstream out(positional[2]);
        if (!out) throw std::runtime_error(std::format("creating {}", positional[2]));
        tf::grid::write_map(out, tf::grid::to_map_data(grid), pretty);

        if (ascii) {
            auto view = tf::grid::to_ascii(grid);
            std::cout << view.ground << '\n' << view.objects;
        }

        const auto report = tf::roadnet::validate(grid);
        const auto stats = grid.stats();
        std::cerr << "Wrote: " << positional[2] << " (" << width << "x" << height << ")\n";
        std::cerr << "Ground: " << stats.ground_filled << "/" << stats.total_cells
                  << ", Objects: " << stats.objects_filled << '\n';
        std::cerr << "Roads: " << report.total_tiles << " tiles, " << report.island_count << " island(s), "
                  << runner.session().road_tiles.size() << " laid by this plan, "
                  << runner.session().budget_remaining() << " budget left\n";
        if (failed > 0) std::cerr << "Failed actions: " << failed << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
