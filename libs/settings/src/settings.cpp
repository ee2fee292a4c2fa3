#include "tileforge/settings.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace tileforge::settings {

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;

fs::path executable_dir() {
    std::error_code ec;
    auto link_path = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return link_path.parent_path();
    }
    return fs::current_path();
}

const json* section(const json& root, const char* name) {
    if (root.contains(name) && root.at(name).is_object()) return &root.at(name);
    return nullptr;
}

template <typename T, typename Accept>
void read_field(const json& node, const char* key, T& out, Accept accept) {
    if (!node.contains(key)) return;
    try {
        T v = node.at(key).get<T>();
        if (accept(v)) out = v;
    } catch (const json::exception&) {
        // wrong type: keep the default for this field only
    }
}

bool valid_layer(const std::string& s) { return s == "ground" || s == "objects"; }

bool valid_format(const std::string& s) { return s == "png" || s == "jpeg" || s == "jpg" || s == "tga"; }

} // namespace

int Settings::road_budget(int width, int height) const {
    return static_cast<int>(std::floor(static_cast<double>(width) * height * roads.budget_fraction));
}

fs::path settings_path() {
    const char* override_path = std::getenv("TILEFORGE_CONFIG");
    if (override_path && override_path[0] != '\0') {
        return fs::path(override_path);
    }

    const auto beside_exe = executable_dir() / "tileforge.json";
    if (fs::exists(beside_exe)) {
        return beside_exe;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return fs::path(home) / ".config" / "tileforge" / "tileforge.json";
    }

    return beside_exe;
}

Settings load_settings() { return load_settings(settings_path()); }

Settings load_settings(const fs::path& path) {
    Settings s;

    std::ifstream stream(path);
    if (!stream.is_open()) {
        return s;
    }

    json parsed;
    try {
        parsed = json::parse(stream);
    } catch (const json::exception&) {
        return Settings{};
    }
    if (!parsed.is_object()) return s;

    auto positive_int = [](int v) { return v > 0; };
    auto fraction = [](double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; };
    auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };

    if (const auto* m = section(parsed, "map")) {
        read_field(*m, "width", s.map.width, positive_int);
        read_field(*m, "height", s.map.height, positive_int);
    }
    if (const auto* r = section(parsed, "roads")) {
        read_field(*r, "budget_fraction", s.roads.budget_fraction, fraction);
    }
    if (const auto* r = section(parsed, "render")) {
        read_field(*r, "scale", s.render.scale, positive);
        read_field(*r, "format", s.render.format, valid_format);
        read_field(*r, "quality", s.render.quality, [](int v) { return v >= 1 && v <= 100; });
        read_field(*r, "background", s.render.background, [](const std::string& v) { return !v.empty(); });
        read_field(*r, "layers", s.render.layers, [](const std::vector<std::string>& v) {
            return std::all_of(v.begin(), v.end(), valid_layer);
        });
    }
    return s;
}

bool save_settings(const Settings& s) { return save_settings(s, settings_path()); }

bool save_settings(const Settings& s, const fs::path& path) {
    json out;
    out["map"] = {{"width", s.map.width}, {"height", s.map.height}};
    out["roads"] = {{"budget_fraction", s.roads.budget_fraction}};
    out["render"] = {
        {"scale", s.render.scale},
        {"format", s.render.format},
        {"quality", s.render.quality},
        {"background", s.render.background},
        {"layers", s.render.layers},
    };

    std::error_code ec;
    if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

    std::ofstream stream(path);
    if (!stream.is_open()) {
        return false;
    }
    stream << out.dump(2) << "\n";
    return static_cast<bool>(stream);
}

} // namespace tileforge::settings
