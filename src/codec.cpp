#include "codec.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "checksum.h"

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

static bool resolution_ok(int v) {
    return v > 0 && v <= GT911_MAX_RESOLUTION && v % 2 == 0;
}

void validate_settings(const Settings& s) {
    if (!resolution_ok(s.x_max) || !resolution_ok(s.y_max))
        throw ValidationError("resolution out of range or odd (got " +
                              std::to_string(s.x_max) + "x" +
                              std::to_string(s.y_max) + ")");
}

// -----------------------------------------------------------------------
// Encoder
// -----------------------------------------------------------------------

ConfigBlob encode_config(const Settings& s) {
    validate_settings(s);

    ConfigBlob blob{};

    write_field(blob, Field::ConfigVersion, GT911_CONFIG_VERSION);
    write_field(blob, Field::XMax, static_cast<uint16_t>(s.x_max));
    write_field(blob, Field::YMax, static_cast<uint16_t>(s.y_max));

    // Out-of-range touch counts are adjusted, not rejected.
    int points = std::min(std::max(GT911_MIN_TOUCH_POINTS, s.num_touch_points),
                          GT911_MAX_TOUCH_POINTS);
    write_field(blob, Field::TouchPoints, static_cast<uint16_t>(points));

    // No axis swap/invert.
    write_field(blob, Field::ModuleSwitch1, GT911_MODULE_SWITCH1);
    write_field(blob, Field::ModuleSwitch2, GT911_MODULE_SWITCH2);
    write_field(blob, Field::ShakeCount,    GT911_SHAKE_COUNT);

    write_field(blob, Field::Filter,
                static_cast<uint16_t>(s.filter_coefficient & 0xFF));

    // Floor only; values >= 256 wrap when stored in the single byte.
    int threshold = std::max(1, s.touch_threshold);
    write_field(blob, Field::TouchThreshold,
                static_cast<uint16_t>(threshold & 0xFF));

    write_field(blob, Field::Checksum, compute_checksum(blob));
    write_field(blob, Field::ConfigFresh, GT911_CONFIG_FRESH);
    return blob;
}

// -----------------------------------------------------------------------
// Decoder
// -----------------------------------------------------------------------

ConfigView decode_config(const ConfigBlob& blob) {
    ConfigView v;
    v.config_version   = static_cast<uint8_t>(read_field(blob, Field::ConfigVersion));
    v.x_max            = read_field(blob, Field::XMax);
    v.y_max            = read_field(blob, Field::YMax);
    v.num_touch_points = static_cast<uint8_t>(read_field(blob, Field::TouchPoints));
    v.module_switch1   = static_cast<uint8_t>(read_field(blob, Field::ModuleSwitch1));
    v.module_switch2   = static_cast<uint8_t>(read_field(blob, Field::ModuleSwitch2));
    v.shake_count      = static_cast<uint8_t>(read_field(blob, Field::ShakeCount));
    v.filter           = static_cast<uint8_t>(read_field(blob, Field::Filter));
    v.touch_threshold  = static_cast<uint8_t>(read_field(blob, Field::TouchThreshold));
    v.checksum         = static_cast<uint8_t>(read_field(blob, Field::Checksum));
    v.config_fresh     = static_cast<uint8_t>(read_field(blob, Field::ConfigFresh));
    return v;
}

ConfigBlob to_blob(const std::vector<uint8_t>& data) {
    if (data.size() != GT911_CONFIG_SIZE)
        throw BufferLengthError(data.size());
    ConfigBlob blob;
    std::copy(data.begin(), data.end(), blob.begin());
    return blob;
}

ConfigView decode_config(const std::vector<uint8_t>& data) {
    return decode_config(to_blob(data));
}

// -----------------------------------------------------------------------
// Diagnostics
// -----------------------------------------------------------------------

static std::string reg_label(Field f) {
    const FieldSpec& s = field_spec(f);
    std::ostringstream ss;
    ss << std::uppercase << std::hex << std::setfill('0')
       << "0x" << std::setw(4) << register_address(s.offset);
    if (s.width == 2)
        ss << ".." << std::setw(2) << (register_address(s.offset + 1) & 0xFF);
    return ss.str();
}

static void print_row(std::ostream& out, Field f, const std::string& value) {
    std::string label = std::string(field_spec(f).name) + " (" + reg_label(f) + "):";
    out << " " << std::left << std::setw(32) << label << value
              << std::right << "\n";
}

static std::string hex8(uint8_t b) {
    std::ostringstream ss;
    ss << "0x" << std::uppercase << std::hex << std::setw(2)
       << std::setfill('0') << static_cast<int>(b);
    return ss.str();
}

void print_config_details(const ConfigView& v, std::ostream& out) {
    out << "\n=== GT911 Configuration Details ===\n";
    print_row(out, Field::ConfigVersion,  hex8(v.config_version));
    print_row(out, Field::XMax,           std::to_string(v.x_max));
    print_row(out, Field::YMax,           std::to_string(v.y_max));
    print_row(out, Field::TouchPoints,    std::to_string(v.num_touch_points));
    print_row(out, Field::ModuleSwitch1,  hex8(v.module_switch1));
    print_row(out, Field::ModuleSwitch2,  hex8(v.module_switch2));
    print_row(out, Field::ShakeCount,     std::to_string(v.shake_count));
    print_row(out, Field::Filter,         std::to_string(v.filter));
    print_row(out, Field::TouchThreshold, std::to_string(v.touch_threshold));
    print_row(out, Field::Checksum,       hex8(v.checksum));
    print_row(out, Field::ConfigFresh,    hex8(v.config_fresh));
    out << "===================================\n";
}

void hexdump_config(const ConfigBlob& blob, std::ostream& out) {
    out << std::hex << std::setfill('0');
    for (std::size_t row = 0; row < blob.size(); row += 16) {
        out << std::setw(4) << register_address(row) << ": ";
        std::size_t end = std::min(row + 16, blob.size());
        for (std::size_t i = row; i < end; ++i) {
            out << std::setw(2) << static_cast<int>(blob[i]);
            if (i + 1 < end) out << " ";
        }
        out << "\n";
    }
    out << std::dec << std::setfill(' ');
}
