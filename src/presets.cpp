#include "presets.h"

#include <algorithm>
#include <cctype>
#include <iostream>

// -----------------------------------------------------------------------
// Known display panels.
//   name, description, {x_max, y_max, threshold, touch points, filter}
// -----------------------------------------------------------------------
static const std::vector<Preset> preset_table = {
    {"7inch",      "Generic 7\" 1024x600 panel",   {1024, 600, 16, 5, 4}},
    {"5inch",      "Generic 5\" 800x480 panel",    { 800, 480, 20, 5, 4}},
    {"waveshare7", "Waveshare 7\" 1280x800 panel", {1280, 800, 28, 5, 4}},
};

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

const std::vector<Preset>& presets() {
    return preset_table;
}

bool find_preset(const std::string& name, Settings& out) {
    std::string key = to_lower(name);
    auto it = std::find_if(preset_table.begin(), preset_table.end(),
                           [&](const Preset& p) { return p.name == key; });
    if (it == preset_table.end()) return false;
    out = it->settings;
    return true;
}

Settings default_settings() {
    return preset_table.front().settings;
}

void list_presets(std::ostream& out) {
    out << "Available presets:\n";
    for (auto& p : preset_table) {
        const Settings& s = p.settings;
        out << "\n" << p.name << "  (" << p.description << ")\n"
                  << "  Resolution:         " << s.x_max << "x" << s.y_max << "\n"
                  << "  Touch Threshold:    " << s.touch_threshold << "\n"
                  << "  Number of Touches:  " << s.num_touch_points << "\n"
                  << "  Filter Coefficient: " << s.filter_coefficient << "\n";
    }
}
