#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tileforge::settings {

struct MapSettings {
    int width = 10;
    int height = 10;
};

struct RoadSettings {
    double budget_fraction = 0.25;
};

struct RenderSettings {
    double scale = 0.25;
    std::string format = "png";
    int quality = 90;
    std::string background = "#000000";
    std::vector<std::string> layers = {"ground", "objects"};
};

struct Settings {
    MapSettings map;
    RoadSettings roads;
    RenderSettings render;

    // road_budget is floor(width * height * budget_fraction).
    int road_budget(int width, int height) const;
};

// settings_path resolves TILEFORGE_CONFIG, then tileforge.json beside the
// executable, then ~/.config/tileforge/tileforge.json.
std::filesystem::path settings_path();

// load_settings never fails: missing or malformed files give defaults and
// invalid fields are ignored one by one.
Settings load_settings();
Settings load_settings(const std::filesystem::path& path);

bool save_settings(const Settings& s);
bool save_settings(const Settings& s, const std::filesystem::path& path);

} // namespace tileforge::settings
