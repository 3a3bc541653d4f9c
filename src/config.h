#pragma once

#include <string>

#include "codec.h"
#include "presets.h"

// Parsed representation of an INI configuration file.
//
//   [preset]
//   name = 7inch            ; base values, [touch] keys override them
//
//   [touch]
//   x_max = 1024
//   y_max = 600
//   touch_threshold = 16
//   num_touch_points = 5
//   filter_coefficient = 4
//
//   [output]
//   file = goodix_911_cfg.bin
//   install = 0
//   reload = 0
struct Config {
    Settings settings;  // starts from the caller's base settings

    std::string preset;  // empty if no [preset] section

    struct OutputConfig {
        std::string file    = "goodix_911_cfg.bin";
        bool        install = false;
        bool        reload  = false;
    } output;
};

// Parse an INI config file from disk. `base` supplies the settings when
// the file has no [preset] section; [touch] keys are applied on top.
// Throws std::runtime_error if the file cannot be read, a value is not a
// number, or the preset name is unknown.
Config parse_config_file(const std::string& path,
                         const Settings& base = default_settings());

// Strict range check applied to user-supplied values before encoding:
//   x_max, y_max       2-4094, even
//   touch_threshold    1-255
//   num_touch_points   1-10
//   filter_coefficient 0-15
// Throws std::runtime_error naming the first value out of range.
void validate_config(const Settings& s);
