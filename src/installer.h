#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "layout.h"

// Default firmware location read by the goodix kernel driver
static constexpr const char* GT911_FIRMWARE_DIR  = "/lib/firmware";
static constexpr const char* GT911_FIRMWARE_NAME = "goodix_911_cfg.bin";
static constexpr const char* GT911_DRIVER_MODULE = "goodix";

struct SystemCheck {
    bool        ok = false;
    std::string message;
};

// Write the image verbatim to `path`.
// Throws std::runtime_error on any I/O failure.
void save_config_file(const ConfigBlob& blob, const std::string& path);

// Read an entire file into memory. The length is not checked here.
// Throws std::runtime_error if the file cannot be read.
std::vector<uint8_t> read_config_file(const std::string& path);

// Checks that the firmware directory exists, modprobe is on PATH and
// `modprobe -n <module>` succeeds.
SystemCheck check_system_requirements(const std::string& firmware_dir = GT911_FIRMWARE_DIR,
                                      const std::string& module = GT911_DRIVER_MODULE);

// Write <firmware_dir>/goodix_911_cfg.bin with mode 0644.
// Returns the installed path. Throws std::runtime_error on failure.
std::string install_config(const ConfigBlob& blob,
                           const std::string& firmware_dir = GT911_FIRMWARE_DIR);

// Unload and reload the goodix kernel module so it picks up the new file.
// Throws std::runtime_error if either modprobe call fails.
void reload_driver();

// Locate an executable on PATH (plus /sbin and /usr/sbin).
// Returns an empty string if not found.
std::string find_program(const std::string& name);
