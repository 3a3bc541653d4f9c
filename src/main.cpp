#include <getopt.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#include "checksum.h"
#include "cli.h"
#include "codec.h"
#include "installer.h"
#include "menu.h"
#include "presets.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.0.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS]

Goodix GT911 touch controller configuration generator for Linux.
Builds the 186-byte register image (0x8047..0x8100) read by the goodix
kernel driver from /lib/firmware/goodix_911_cfg.bin.

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit

  -i, --interactive        Run the interactive menu

  -p, --preset NAME        Start from a preset (7inch, 5inch, waveshare7)
  --list-presets           Print all presets and exit
  -c, --config FILE        Read settings from an INI config file

  -x, --x-max N            X resolution (2-4094, even)
  -y, --y-max N            Y resolution (2-4094, even)
  -t, --threshold N        Touch threshold (1-255)
  -n, --touch-points N     Number of touch points (1-10)
  -f, --filter N           Filter coefficient (0-15)

  -o, --output FILE        Write the image to FILE
                           (default: goodix_911_cfg.bin)
  --install                Install the image as DIR/goodix_911_cfg.bin
  --firmware-dir DIR       Firmware directory for --install and the menu
                           (default: /lib/firmware)
  --reload                 Reload the goodix kernel module after install
  --show                   Print the decoded field table
  --hexdump                Print a hex dump of the image

  -d, --decode FILE        Decode an existing image and print its fields
  --verify FILE            Check an existing image's checksum
                           (exit status 0 = valid, 2 = mismatch)

Examples:
  gt911-cfg --list-presets
  gt911-cfg --preset 5inch --show
  gt911-cfg -x 1280 -y 800 -t 28 -o my_panel.bin
  gt911-cfg --config examples/panel.ini
  sudo gt911-cfg --preset waveshare7 --install --reload
  gt911-cfg --decode /lib/firmware/goodix_911_cfg.bin
)";
}

// Parse a numeric option argument; exits via exception on bad input.
static int parse_int_arg(const char* opt, const char* arg) {
    std::string s = arg;
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != s.size())
        throw std::runtime_error(std::string("invalid ") + opt + " argument: " + s);
    return v;
}

// Decode an image file, print it, and report the checksum.
static int decode_file(const std::string& path, bool hexdump) {
    ConfigBlob blob = to_blob(read_config_file(path));
    print_config_details(decode_config(blob));
    if (hexdump) {
        std::cout << "\n";
        hexdump_config(blob);
    }
    if (verify_checksum(blob)) {
        std::cout << "Checksum OK\n";
    } else {
        std::cout << "Checksum MISMATCH (stored 0x" << std::hex
                  << static_cast<int>(read_field(blob, Field::Checksum))
                  << ", computed 0x" << static_cast<int>(compute_checksum(blob))
                  << std::dec << ")\n";
    }
    return 0;
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- collect requested operations ----
    bool        do_interactive = false;
    bool        do_install     = false;
    bool        do_reload      = false;
    bool        do_show        = false;
    bool        do_hexdump     = false;
    CliSources  sources;
    std::string output_file;
    std::string install_dir    = GT911_FIRMWARE_DIR;
    std::string decode_path;
    std::string verify_path;

    CliOverrides& ov = sources.overrides;

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, CLI_SHORT_OPTIONS,
                                  CLI_LONG_OPTIONS, nullptr)) != -1) {
            switch (opt) {
            case 'h':
                print_help(argv[0]);
                return 0;

            case 'V':
                std::cout << "gt911-cfg " << VERSION << "\n";
                return 0;

            case 'i': do_interactive = true;  break;
            case 'p': sources.preset      = optarg; break;
            case 'c': sources.config_file = optarg; break;
            case 'o': output_file         = optarg; break;
            case 'd': decode_path         = optarg; break;

            case 'x': ov.x_max     = parse_int_arg("--x-max", optarg);        ov.has_x = true;         break;
            case 'y': ov.y_max     = parse_int_arg("--y-max", optarg);        ov.has_y = true;         break;
            case 't': ov.threshold = parse_int_arg("--threshold", optarg);    ov.has_threshold = true; break;
            case 'n': ov.points    = parse_int_arg("--touch-points", optarg); ov.has_points = true;    break;
            case 'f': ov.filter    = parse_int_arg("--filter", optarg);       ov.has_filter = true;    break;

            case OPT_LIST_PRESETS:
                list_presets();
                return 0;

            case OPT_INSTALL: do_install = true; break;
            case OPT_RELOAD:  do_reload  = true; break;
            case OPT_SHOW:    do_show    = true; break;
            case OPT_HEXDUMP: do_hexdump = true; break;

            case OPT_VERIFY:
                verify_path = optarg;
                break;

            case OPT_FIRMWARE_DIR:
                install_dir = optarg;
                break;

            default:
                std::cerr << "Use --help for usage.\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (optind < argc) {
        std::cerr << "Error: unexpected argument '" << argv[optind] << "'\n";
        return 1;
    }

    try {
        // ---- --verify FILE ----
        if (!verify_path.empty())
            return verify_exit_status(verify_path);

        // ---- --decode FILE ----
        if (!decode_path.empty())
            return decode_file(decode_path, do_hexdump);

        // ---- settings: preset, config file, inline values ----
        // The menu range-checks its own input, so only the batch path is
        // validated strictly.
        if (!sources.config_file.empty())
            std::cout << "=== Reading config: " << sources.config_file << " ===\n";
        Config cfg = resolve_settings(sources, !do_interactive);
        const Settings& s = cfg.settings;

        if (!sources.config_file.empty()) {
            if (output_file.empty() && !cfg.output.file.empty())
                output_file = cfg.output.file;
            do_install = do_install || cfg.output.install;
            do_reload  = do_reload  || cfg.output.reload;
        }
        if (do_reload && !do_install)
            throw std::runtime_error("--reload requires --install");

        // ---- --interactive ----
        if (do_interactive) {
            if (::geteuid() != 0) {
                std::cout << "\nNote: installing to " << install_dir
                          << " and reloading the driver require root.\n";
            }
            SystemCheck check = check_system_requirements(install_dir);
            if (!check.ok)
                std::cerr << "Warning: " << check.message
                          << ". Some features may not work correctly.\n";

            MenuOptions mo;
            mo.initial      = s;
            mo.firmware_dir = install_dir;
            run_interactive_menu(std::cin, std::cout, mo);
            return 0;
        }

        ConfigBlob blob = encode_config(s);

        if (do_show)
            print_config_details(decode_config(blob));
        if (do_hexdump) {
            std::cout << "\n";
            hexdump_config(blob);
        }

        bool has_work = do_show || do_hexdump || do_install || !output_file.empty();
        if (!has_work)
            output_file = GT911_FIRMWARE_NAME;

        if (!output_file.empty()) {
            save_config_file(blob, output_file);
            std::cout << "Configuration saved to '" << output_file << "'.\n";
        }

        // ---- --install ----
        if (do_install) {
            SystemCheck check = check_system_requirements(install_dir);
            if (!check.ok)
                throw std::runtime_error("System requirements not met: " + check.message);

            std::string path = install_config(blob, install_dir);
            std::cout << "Configuration installed to " << path << ".\n";

            if (do_reload) {
                std::cout << "Reloading " << GT911_DRIVER_MODULE << " driver...\n";
                reload_driver();
                std::cout << "Driver reloaded. Check dmesg for results: dmesg | grep Goodix\n";
            } else {
                std::cout << "Driver not reloaded. Changes take effect after reboot "
                             "or with --reload.\n";
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
