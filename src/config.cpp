#include "config.h"
#include "presets.h"

#include <cctype>
#include <fstream>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static int parse_int(const std::string& key, const std::string& value, int lineno) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size())
            throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error(
            "Invalid " + key + " '" + value + "' at line " +
            std::to_string(lineno));
    }
}

static bool parse_bool(const std::string& value) {
    std::string v = to_lower(value);
    return v == "1" || v == "yes" || v == "true" || v == "on";
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config_file(const std::string& path, const Settings& base) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);

    Config cfg;
    cfg.settings = base;

    // [touch] keys are applied after the file is read so that a [preset]
    // section anywhere in the file acts as the base.
    std::map<std::string, int> overrides;

    std::regex re_section(R"(^\[([^\]]+)\])");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");

    std::string section;
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            throw std::runtime_error("Syntax error at line " + std::to_string(lineno) +
                                     ": " + line);

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());

        if (section == "touch") {
            if (key == "x_max" || key == "y_max" || key == "touch_threshold" ||
                key == "num_touch_points" || key == "filter_coefficient")
                overrides[key] = parse_int(key, value, lineno);
            // Unknown touch keys are silently ignored

        } else if (section == "preset") {
            if (key == "name") {
                Settings preset;
                if (!find_preset(value, preset))
                    throw std::runtime_error(
                        "Unknown preset '" + value + "' at line " +
                        std::to_string(lineno));
                cfg.preset   = to_lower(value);
                cfg.settings = preset;
            }

        } else if (section == "output") {
            if      (key == "file")    cfg.output.file    = value;
            else if (key == "install") cfg.output.install = parse_bool(value);
            else if (key == "reload")  cfg.output.reload  = parse_bool(value);
        }
        // Unknown sections are silently ignored
    }

    for (auto& [key, v] : overrides) {
        if      (key == "x_max")              cfg.settings.x_max              = v;
        else if (key == "y_max")              cfg.settings.y_max              = v;
        else if (key == "touch_threshold")    cfg.settings.touch_threshold    = v;
        else if (key == "num_touch_points")   cfg.settings.num_touch_points   = v;
        else if (key == "filter_coefficient") cfg.settings.filter_coefficient = v;
    }

    return cfg;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

static void check_range(const char* what, int v, int lo, int hi) {
    if (v < lo || v > hi)
        throw std::runtime_error(
            std::string(what) + " must be " + std::to_string(lo) + "-" +
            std::to_string(hi) + " (got " + std::to_string(v) + ")");
}

void validate_config(const Settings& s) {
    check_range("X resolution", s.x_max, 2, GT911_MAX_RESOLUTION - 1);
    check_range("Y resolution", s.y_max, 2, GT911_MAX_RESOLUTION - 1);
    if (s.x_max % 2 != 0 || s.y_max % 2 != 0)
        throw std::runtime_error("Resolution values must be even numbers");

    check_range("Touch threshold", s.touch_threshold, 1, 255);
    check_range("Number of touch points", s.num_touch_points,
                GT911_MIN_TOUCH_POINTS, GT911_MAX_TOUCH_POINTS);
    check_range("Filter coefficient", s.filter_coefficient, 0, 15);
}
