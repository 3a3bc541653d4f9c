#include "checksum.h"
#include "codec.h"
#include "installer.h"
#include "menu.h"
#include "presets.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static SystemCheck system_ok(const std::string&) {
    return {true, "System requirements met"};
}

// Fresh temp directory, removed recursively on scope exit.
struct TempDir {
    fs::path path;

    TempDir() {
        static int n = 0;
        path = fs::temp_directory_path() /
               ("gt911cfg_dir_" + std::to_string(::getpid()) + "_" + std::to_string(n++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

// ============================================================================
// File I/O
// ============================================================================

TEST_CASE("Installer: saved file holds the exact image", "[installer]") {
    TempDir dir;
    std::string file = (dir.path / "out.bin").string();
    ConfigBlob blob = encode_config(default_settings());

    save_config_file(blob, file);
    CHECK(fs::file_size(file) == GT911_CONFIG_SIZE);

    std::vector<uint8_t> back = read_config_file(file);
    REQUIRE(back.size() == GT911_CONFIG_SIZE);
    CHECK(std::equal(back.begin(), back.end(), blob.begin()));
    CHECK(verify_checksum(back));
}

TEST_CASE("Installer: truncated file fails to decode", "[installer]") {
    TempDir dir;
    std::string file = (dir.path / "short.bin").string();
    {
        std::ofstream f(file, std::ios::binary);
        f << "GT911";
    }
    std::vector<uint8_t> data = read_config_file(file);
    CHECK(data.size() == 5);
    CHECK_THROWS_AS(decode_config(data), BufferLengthError);
}

TEST_CASE("Installer: I/O errors are reported", "[installer]") {
    ConfigBlob blob = encode_config(default_settings());
    CHECK_THROWS_AS(save_config_file(blob, "/nonexistent/dir/out.bin"), std::runtime_error);
    CHECK_THROWS_AS(read_config_file("/nonexistent/dir/in.bin"), std::runtime_error);
}

// ============================================================================
// Install
// ============================================================================

TEST_CASE("Installer: install writes the firmware file with mode 0644", "[installer]") {
    TempDir dir;
    ConfigBlob blob = encode_config(default_settings());

    std::string target = install_config(blob, dir.path.string());
    CHECK(fs::path(target) == dir.path / GT911_FIRMWARE_NAME);
    CHECK(fs::file_size(target) == GT911_CONFIG_SIZE);

    fs::perms p = fs::status(target).permissions() & fs::perms::all;
    CHECK(static_cast<unsigned>(p) == 0644u);
}

TEST_CASE("Installer: missing firmware directory", "[installer]") {
    ConfigBlob blob = encode_config(default_settings());
    CHECK_THROWS_WITH(install_config(blob, "/nonexistent/firmware"),
                      Catch::Contains("does not exist"));

    SystemCheck check = check_system_requirements("/nonexistent/firmware");
    CHECK_FALSE(check.ok);
    CHECK(check.message.find("/nonexistent/firmware") != std::string::npos);
}

TEST_CASE("Installer: system check requires the driver module", "[installer]") {
    TempDir dir;
    SystemCheck check = check_system_requirements(dir.path.string(),
                                                  "gt911cfg-no-such-module");
    CHECK_FALSE(check.ok);
    if (find_program("modprobe").empty())
        CHECK(check.message == "modprobe command not found");
    else
        CHECK(check.message == "Goodix driver module not available");
}

TEST_CASE("Installer: find_program", "[installer]") {
    CHECK_FALSE(find_program("sh").empty());
    CHECK(find_program("no-such-program-gt911").empty());
}

// ============================================================================
// Interactive menu
// ============================================================================

TEST_CASE("Menu: edits settings and re-prompts on bad input", "[menu]") {
    std::istringstream in(
        "2\n40\n"          // threshold
        "3\n12\nabc\n7\n"  // touch points: out of range, not a number, then 7
        "1\n1280\n\n"      // X changed, Y kept
        "0\n");
    std::ostringstream out;

    Settings s = run_interactive_menu(in, out);

    CHECK(s.touch_threshold == 40);
    CHECK(s.num_touch_points == 7);
    CHECK(s.x_max == 1280);
    CHECK(s.y_max == 600);
    CHECK(out.str().find("Value must be between 1 and 10") != std::string::npos);
    CHECK(out.str().find("Please enter a valid number") != std::string::npos);
    CHECK(out.str().find("Exiting configuration generator.") != std::string::npos);
}

TEST_CASE("Menu: loads presets", "[menu]") {
    std::istringstream in("6\nwaveshare7\n0\n");
    std::ostringstream out;

    Settings s = run_interactive_menu(in, out);
    CHECK(s.x_max == 1280);
    CHECK(s.touch_threshold == 28);
}

TEST_CASE("Menu: unknown preset falls back to defaults", "[menu]") {
    MenuOptions mo;
    mo.initial.x_max = 800;
    std::istringstream in("6\nbogus\n0\n");
    std::ostringstream out;

    Settings s = run_interactive_menu(in, out, mo);
    CHECK(s.x_max == default_settings().x_max);
    CHECK(out.str().find("Unknown preset 'bogus'") != std::string::npos);
}

TEST_CASE("Menu: generate and save", "[menu]") {
    TempDir dir;
    std::string file = (dir.path / "menu.bin").string();
    std::istringstream in("7\n" + file + "\n0\n");
    std::ostringstream out;

    run_interactive_menu(in, out);

    std::vector<uint8_t> data = read_config_file(file);
    REQUIRE(data.size() == GT911_CONFIG_SIZE);
    CHECK(data[184] == 0x85);
}

TEST_CASE("Menu: install without driver reload", "[menu]") {
    TempDir dir;
    MenuOptions mo;
    mo.firmware_dir = dir.path.string();
    mo.system_check = system_ok;
    std::istringstream in("8\nn\n0\n");
    std::ostringstream out;

    run_interactive_menu(in, out, mo);

    CHECK(fs::exists(dir.path / GT911_FIRMWARE_NAME));
    CHECK(out.str().find("Driver not reloaded") != std::string::npos);
}

TEST_CASE("Menu: install is skipped when the system check fails", "[menu]") {
    TempDir dir;
    MenuOptions mo;
    mo.firmware_dir = dir.path.string();
    mo.system_check = [](const std::string&) {
        return SystemCheck{false, "Goodix driver module not available"};
    };
    std::istringstream in("8\n0\n");
    std::ostringstream out;

    run_interactive_menu(in, out, mo);

    CHECK(out.str().find("System requirements not met: Goodix driver module not available") !=
          std::string::npos);
    CHECK_FALSE(fs::exists(dir.path / GT911_FIRMWARE_NAME));
    CHECK(out.str().find("reload the goodix driver") == std::string::npos);
    CHECK(out.str().find("Exiting configuration generator.") != std::string::npos);
}

TEST_CASE("Menu: errors are shown and the menu continues", "[menu]") {
    MenuOptions mo;
    mo.firmware_dir = "/nonexistent/firmware";
    mo.system_check = system_ok;
    std::istringstream in("8\n9\n0\n");
    std::ostringstream out;

    run_interactive_menu(in, out, mo);

    CHECK(out.str().find("Error: Firmware directory") != std::string::npos);
    CHECK(out.str().find("GT911 Configuration Details") != std::string::npos);
}

TEST_CASE("Menu: end of input exits", "[menu]") {
    std::istringstream in("2\n");
    std::ostringstream out;
    Settings s = run_interactive_menu(in, out);
    CHECK(s.touch_threshold == default_settings().touch_threshold);
}
