#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "codec.h"

struct Preset {
    std::string name;
    std::string description;
    Settings    settings;
};

// All built-in presets, in display order.
const std::vector<Preset>& presets();

// Look up a preset by name (case-insensitive).
// Returns false if the name is not recognized.
bool find_preset(const std::string& name, Settings& out);

// Settings used when nothing else is given (the "7inch" preset).
Settings default_settings();

// Print every preset and its values (for --list-presets)
void list_presets(std::ostream& out = std::cout);
