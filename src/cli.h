#pragma once

#include <getopt.h>
#include <iostream>
#include <string>

#include "config.h"

// Long-only option ids
enum CliOption {
    OPT_LIST_PRESETS = 1001,
    OPT_INSTALL,
    OPT_RELOAD,
    OPT_SHOW,
    OPT_HEXDUMP,
    OPT_VERIFY,
    OPT_FIRMWARE_DIR,
};

// getopt_long tables for gt911-cfg
extern const char* const   CLI_SHORT_OPTIONS;
extern const struct option CLI_LONG_OPTIONS[];

// Values given on the command line with -x/-y/-t/-n/-f. They override
// the preset and config file values when set.
struct CliOverrides {
    int  x_max = 0, y_max = 0, threshold = 0, points = 0, filter = 0;
    bool has_x = false, has_y = false, has_threshold = false,
         has_points = false, has_filter = false;
};

// Where the CLI takes its settings from.
struct CliSources {
    std::string  preset;       // -p/--preset, empty for the defaults
    std::string  config_file;  // -c/--config, empty for none
    CliOverrides overrides;
};

// Resolve the settings in the order default -> preset -> config file ->
// inline overrides. A config file without a [preset] section keeps the
// preset chosen on the command line. With `strict` set the result goes
// through validate_config().
// The returned Config carries the config file's [output] section (or its
// defaults when no file is given).
// Throws std::runtime_error for an unknown preset, a bad config file or,
// when strict, a value out of range.
Config resolve_settings(const CliSources& src, bool strict = true);

// --verify: read an image file, print "<path>: checksum OK|MISMATCH" and
// return the exit status (0 = valid, 2 = mismatch).
// Throws std::runtime_error if the file cannot be read and
// BufferLengthError if it is not 186 bytes.
int verify_exit_status(const std::string& path, std::ostream& out = std::cout);
