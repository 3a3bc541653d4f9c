#include "cli.h"

#include <stdexcept>

#include "checksum.h"
#include "installer.h"
#include "presets.h"

const char* const CLI_SHORT_OPTIONS = "hVip:c:x:y:t:n:f:o:d:";

const struct option CLI_LONG_OPTIONS[] = {
    {"help",         no_argument,       nullptr, 'h'},
    {"version",      no_argument,       nullptr, 'V'},
    {"interactive",  no_argument,       nullptr, 'i'},
    {"preset",       required_argument, nullptr, 'p'},
    {"config",       required_argument, nullptr, 'c'},
    {"x-max",        required_argument, nullptr, 'x'},
    {"y-max",        required_argument, nullptr, 'y'},
    {"threshold",    required_argument, nullptr, 't'},
    {"touch-points", required_argument, nullptr, 'n'},
    {"filter",       required_argument, nullptr, 'f'},
    {"output",       required_argument, nullptr, 'o'},
    {"decode",       required_argument, nullptr, 'd'},
    {"list-presets", no_argument,       nullptr, OPT_LIST_PRESETS},
    {"install",      no_argument,       nullptr, OPT_INSTALL},
    {"reload",       no_argument,       nullptr, OPT_RELOAD},
    {"show",         no_argument,       nullptr, OPT_SHOW},
    {"hexdump",      no_argument,       nullptr, OPT_HEXDUMP},
    {"verify",       required_argument, nullptr, OPT_VERIFY},
    {"firmware-dir", required_argument, nullptr, OPT_FIRMWARE_DIR},
    {nullptr, 0, nullptr, 0}
};

Config resolve_settings(const CliSources& src, bool strict) {
    Settings s = default_settings();
    if (!src.preset.empty() && !find_preset(src.preset, s))
        throw std::runtime_error("unknown preset '" + src.preset +
                                 "' (run --list-presets)");

    Config cfg;
    if (!src.config_file.empty())
        cfg = parse_config_file(src.config_file, s);
    else
        cfg.settings = s;

    const CliOverrides& ov = src.overrides;
    if (ov.has_x)         cfg.settings.x_max              = ov.x_max;
    if (ov.has_y)         cfg.settings.y_max              = ov.y_max;
    if (ov.has_threshold) cfg.settings.touch_threshold    = ov.threshold;
    if (ov.has_points)    cfg.settings.num_touch_points   = ov.points;
    if (ov.has_filter)    cfg.settings.filter_coefficient = ov.filter;

    if (strict)
        validate_config(cfg.settings);
    return cfg;
}

int verify_exit_status(const std::string& path, std::ostream& out) {
    bool ok = verify_checksum(read_config_file(path));
    out << path << ": checksum " << (ok ? "OK" : "MISMATCH") << "\n";
    return ok ? 0 : 2;
}
