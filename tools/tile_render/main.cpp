#include <tileforge/catalog.h>
#include <tileforge/grid.h>
#include <tileforge/raster.h>
#include <tileforge/render.h>
#include <tileforge/settings.h>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../common/cli_logger.h"

namespace fs = std::filesystem;
namespace tf = tileforge;

static void print_usage() {
    std::cerr << "Usage: tile_render [flags] <map.json> <catalog.json> <atlas.png|atlas.tga> -o <output>\n\n"
              << "Composites a map image from the sprites of a tile atlas.\n"
              << "Defaults come from the settings file.\n\n"
              << "Flags:\n"
              << "  -o <path>              Output image\n"
              << "  -scale <n>             Sprite scale factor (default: 0.25)\n"
              << "  -format <fmt>          png, jpeg or tga (default: png)\n"
              << "  -quality <n>           JPEG quality 1-100 (default: 90)\n"
              << "  -background <color>    #RGB, #RRGGBB or #RRGGBBAA (default: #000000)\n"
              << "  -layers <list>         Comma-separated: ground,objects\n"
              << "  --save-settings        Store these render options as the new defaults\n"
              << "  -v, --verbose          Enable verbose logging\n"
              << "  -vv, --debug           Enable debug logging\n";
}

static std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

int main(int argc, char* argv[]) {
    const auto settings = tf::settings::load_settings();
    double scale = settings.render.scale;
    std::string format_name = settings.render.format;
    int quality = settings.render.quality;
    std::string background = settings.render.background;
    std::vector<std::string> layers = settings.render.layers;
    std::string output_path;
    bool save_defaults = false;
    int verbosity = 0;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-o") == 0 && i + 1 < argc) output_path = argv[++i];
        else if (std::strcmp(argv[i], "-scale") == 0 && i + 1 < argc) scale = std::stod(argv[++i]);
        else if (std::strcmp(argv[i], "-format") == 0 && i + 1 < argc) format_name = argv[++i];
        else if (std::strcmp(argv[i], "-quality") == 0 && i + 1 < argc) quality = std::stoi(argv[++i]);
        else if (std::strcmp(argv[i], "-background") == 0 && i + 1 < argc) background = argv[++i];
        else if (std::strcmp(argv[i], "-layers") == 0 && i + 1 < argc) layers = split_list(argv[++i]);
        else if (std::strcmp(argv[i], "--save-settings") == 0) save_defaults = true;
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

    if (positional.size() < 3 || output_path.empty()) {
        print_usage();
        return 1;
    }

    auto format = tf::raster::parse_format(format_name);
    if (!format) {
        std::cerr << "Error: unknown format " << format_name << '\n';
        return 1;
    }
    auto bg = tf::raster::parse_color(background);
    if (!bg) {
        std::cerr << "Error: invalid background color " << background << '\n';
        return 1;
    }
    if (!(scale > 0.0)) {
        std::cerr << "Error: scale must be positive\n";
        return 1;
    }

    if (save_defaults) {
        auto updated = settings;
        updated.render = {scale, format_name, quality, background, layers};
        if (tf::settings::save_settings(updated))
            LOGI("Saved render defaults to", tf::settings::settings_path().string());
        else
            LOGW("Could not save settings to", tf::settings::settings_path().string());
    }

    tf::render::RenderOptions opts;
    opts.scale = scale;
    opts.background = *bg;
    opts.ground = std::find(layers.begin(), layers.end(), "ground") != layers.end();
    opts.objects = std::find(layers.begin(), layers.end(), "objects") != layers.end();

    try {
        std::ifstream mf(positional[0]);
        if (!mf) throw std::runtime_error(std::format("cannot open {}", positional[0]));
        auto map = tf::grid::read_map(mf);

        // Render input is not validated against placement rules; the
        // catalog only resolves atlas positions.
        auto cat = tf::catalog::load_file(positional[1], {.strict_connectivity = false});
        LOGI("Catalog", cat.theme(), "tile size", cat.tile_size());

        auto atlas = tf::raster::load_image(positional[2]);
        LOGI("Atlas", positional[2], std::format("{}x{}", atlas.width, atlas.height));

        tf::render::Renderer renderer(cat, atlas);
        auto res = renderer.render(map, opts);
        for (const auto& w : res.warnings) LOGW(w);

        auto bytes = tf::raster::encode(res.image, *format, quality);
        std::ofstream out(output_path, std::ios::binary);
        if (!out) throw std::runtime_error(std::format("creating {}", output_path));
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out) throw std::runtime_error(std::format("writing {}", output_path));

        std::cerr << "Rendered: " << output_path << " (" << res.width << "x" << res.height << ", "
                  << tf::raster::to_string(*format) << ", scale " << res.scale << ")\n";
        std::cerr << "Ground tiles: " << res.stats.ground_tiles_rendered
                  << ", Object tiles: " << res.stats.object_tiles_rendered
                  << ", Unique sprites: " << res.stats.unique_sprites_used << '\n';
        if (!res.warnings.empty()) std::cerr << "Skipped cells: " << res.warnings.size() << '\n';
        LOGD("Output size (bytes):", fs::file_size(output_path));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
