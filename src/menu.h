#pragma once

#include <functional>
#include <iosfwd>
#include <string>

#include "codec.h"
#include "installer.h"

struct MenuOptions {
    Settings    initial      = {};
    std::string firmware_dir = GT911_FIRMWARE_DIR;

    // Run before "install"; the install is skipped when it fails.
    std::function<SystemCheck(const std::string&)> system_check =
        [](const std::string& dir) { return check_system_requirements(dir); };
};

// Numbered menu for editing settings, loading presets, and generating,
// saving or installing the image. Reads choices from `in`, writes prompts
// to `out`. Returns when the user picks 0 or `in` reaches end of input.
// Errors from an action are printed and the menu continues.
// Returns the settings in effect when the menu exits.
Settings run_interactive_menu(std::istream& in, std::ostream& out,
                              const MenuOptions& opts = {});
