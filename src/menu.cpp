#include "menu.h"

#include <iostream>
#include <string>

#include "checksum.h"
#include "presets.h"

// -----------------------------------------------------------------------
// Input helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Prompt until a number in [lo, hi] is entered. Empty input (or end of
// input) keeps `current`.
static int prompt_int(std::istream& in, std::ostream& out,
                      const std::string& prompt, int lo, int hi, int current) {
    while (true) {
        out << prompt << " (" << lo << "-" << hi << ") [" << current << "]: ";
        std::string line;
        if (!std::getline(in, line)) return current;
        line = trim(line);
        if (line.empty()) return current;

        size_t used = 0;
        int v = 0;
        try {
            v = std::stoi(line, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != line.size() || used == 0) {
            out << "Please enter a valid number\n";
            continue;
        }
        if (v < lo || v > hi) {
            out << "Value must be between " << lo << " and " << hi << "\n";
            continue;
        }
        return v;
    }
}

static std::string prompt_line(std::istream& in, std::ostream& out,
                               const std::string& prompt) {
    out << prompt;
    std::string line;
    if (!std::getline(in, line)) return "";
    return trim(line);
}

static void print_menu(std::ostream& out, const Settings& s) {
    out << "\n=== GT911 Configuration Generator ===\n"
        << "\nCURRENT SETTINGS:\n"
        << "  1) Resolution:        " << s.x_max << "x" << s.y_max << "\n"
        << "  2) Touch Threshold:   " << s.touch_threshold << "\n"
        << "  3) Number of Touches: " << s.num_touch_points << "\n"
        << "  4) Filter Coefficient:" << s.filter_coefficient << "\n"
        << "\nACTIONS:\n"
        << "  5) Show Available Presets\n"
        << "  6) Load Preset\n"
        << "  7) Generate and Save Configuration\n"
        << "  8) Generate and Install Configuration\n"
        << "  9) Show Detailed Configuration\n"
        << "  0) Exit\n";
}

// -----------------------------------------------------------------------
// Menu loop
// -----------------------------------------------------------------------

Settings run_interactive_menu(std::istream& in, std::ostream& out,
                              const MenuOptions& opts) {
    Settings s = opts.initial;

    while (true) {
        print_menu(out, s);
        out << "\nChoice: ";

        std::string choice;
        if (!std::getline(in, choice)) {
            out << "\n";
            break;
        }
        choice = trim(choice);

        try {
            if (choice == "1") {
                s.x_max = prompt_int(in, out, "X Resolution", 2, 4094, s.x_max);
                s.y_max = prompt_int(in, out, "Y Resolution", 2, 4094, s.y_max);
            } else if (choice == "2") {
                s.touch_threshold = prompt_int(in, out, "Touch Threshold", 1, 255,
                                               s.touch_threshold);
            } else if (choice == "3") {
                s.num_touch_points = prompt_int(in, out, "Number of Touch Points",
                                                GT911_MIN_TOUCH_POINTS,
                                                GT911_MAX_TOUCH_POINTS,
                                                s.num_touch_points);
            } else if (choice == "4") {
                s.filter_coefficient = prompt_int(in, out, "Filter Coefficient", 0, 15,
                                                  s.filter_coefficient);
            } else if (choice == "5") {
                list_presets(out);
            } else if (choice == "6") {
                list_presets(out);
                std::string name = prompt_line(in, out, "\nEnter preset name: ");
                if (!find_preset(name, s)) {
                    out << "Unknown preset '" << name << "'. Using default values.\n";
                    s = default_settings();
                }
            } else if (choice == "7") {
                ConfigBlob blob = encode_config(s);
                std::string file = prompt_line(in, out,
                                               "Enter filename [goodix_911_cfg.bin]: ");
                if (file.empty()) file = GT911_FIRMWARE_NAME;
                save_config_file(blob, file);
                out << "\nConfiguration saved to '" << file << "' successfully.\n";
            } else if (choice == "8") {
                ConfigBlob blob = encode_config(s);
                out << "\nGenerating and installing configuration...\n";
                SystemCheck check = opts.system_check(opts.firmware_dir);
                if (!check.ok) {
                    out << "System requirements not met: " << check.message << "\n";
                    continue;
                }
                std::string path = install_config(blob, opts.firmware_dir);
                out << "Configuration installed to " << path << ".\n";

                std::string answer = prompt_line(
                    in, out, "Would you like to reload the goodix driver? (y/N): ");
                if (answer == "y" || answer == "Y") {
                    out << "\nReloading driver...\n";
                    reload_driver();
                    out << "Driver reloaded. Check dmesg for results: dmesg | grep Goodix\n";
                } else {
                    out << "\nDriver not reloaded. Changes will take effect after reboot.\n";
                }
            } else if (choice == "9") {
                ConfigBlob blob = encode_config(s);
                print_config_details(decode_config(blob), out);
                if (!verify_checksum(blob))
                    out << "Warning: checksum mismatch\n";
            } else if (choice == "0") {
                out << "\nExiting configuration generator.\n";
                break;
            } else {
                out << "\nInvalid choice. Please try again.\n";
            }
        } catch (const std::exception& e) {
            out << "\nError: " << e.what() << "\n";
        }
    }

    return s;
}
