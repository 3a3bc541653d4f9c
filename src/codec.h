#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "layout.h"

// Semantic input for one encode call.
// The codec adjusts touch points, filter and threshold silently; only the
// resolution is rejected when illegal (see validate_settings).
struct Settings {
    int x_max              = 1024;
    int y_max              = 600;
    int touch_threshold    = 16;
    int num_touch_points   = 5;
    int filter_coefficient = 4;
};

// Thrown when x_max / y_max is odd or outside (0, 4095].
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Thrown when a buffer to decode is not exactly GT911_CONFIG_SIZE bytes.
class BufferLengthError : public std::runtime_error {
public:
    explicit BufferLengthError(std::size_t got)
        : std::runtime_error("config image must be " +
                             std::to_string(GT911_CONFIG_SIZE) +
                             " bytes (got " + std::to_string(got) + ")"),
          _got(got) {}

    std::size_t size() const { return _got; }

private:
    std::size_t _got;
};

// Field view recovered from an image. Values are exactly what is stored.
struct ConfigView {
    uint8_t  config_version   = 0;
    uint16_t x_max            = 0;
    uint16_t y_max            = 0;
    uint8_t  num_touch_points = 0;
    uint8_t  module_switch1   = 0;
    uint8_t  module_switch2   = 0;
    uint8_t  shake_count      = 0;
    uint8_t  filter           = 0;
    uint8_t  touch_threshold  = 0;
    uint8_t  checksum         = 0;
    uint8_t  config_fresh     = 0;
};

// Throws ValidationError if the resolution is illegal.
void validate_settings(const Settings& s);

// Build the 186-byte image.
//   num_touch_points   clamped to [1, 10]
//   filter_coefficient masked to its low byte
//   touch_threshold    floored to 1, then truncated to a byte (256 -> 0)
// Throws ValidationError before anything is built.
ConfigBlob encode_config(const Settings& s);

// Extract every field. Does not check the checksum.
ConfigView decode_config(const ConfigBlob& blob);

// Throws BufferLengthError if data is not exactly GT911_CONFIG_SIZE bytes.
ConfigView decode_config(const std::vector<uint8_t>& data);

// Copy a length-checked buffer into a ConfigBlob.
ConfigBlob to_blob(const std::vector<uint8_t>& data);

// Print the decoded field table with register addresses.
void print_config_details(const ConfigView& v, std::ostream& out = std::cout);

// Hex dump of the whole image, 16 bytes per row, each row prefixed
// with the register address of its first byte.
void hexdump_config(const ConfigBlob& blob, std::ostream& out = std::cout);
