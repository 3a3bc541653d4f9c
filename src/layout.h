#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// -----------------------------------------------------------------------
// GT911 configuration register image (186 bytes)
//
//  Offset | Reg    | Role
//  -------|--------|------------------------------------------------------
//   0     | 0x8047 | Config_Version (fixed 0x01)
//   1-2   | 0x8048 | X output max, u16 little-endian
//   3-4   | 0x804A | Y output max, u16 little-endian
//   5     | 0x804C | Touch_Number (1-10)
//   6     | 0x804D | Module_Switch1 (axis swap/invert bits, 0x00)
//   7     | 0x804E | Module_Switch2 (0x00)
//   8     | 0x804F | Shake_Count (0x03)
//   9     | 0x8050 | Filter
//  12     | 0x8053 | Screen_Touch_Level (touch threshold)
//  184    | 0x80FF | Config_Chksum: two's-complement of sum(bytes[0..183])
//  185    | 0x8100 | Config_Fresh (fixed 0x01)
//
// All other bytes in 0..183 are reserved and written as 0x00.
// -----------------------------------------------------------------------

static constexpr std::size_t GT911_CONFIG_SIZE    = 186;
static constexpr std::size_t GT911_CHECKSUM_SPAN  = 184;  // bytes covered by the checksum
static constexpr uint16_t    GT911_REG_BASE       = 0x8047;

static constexpr uint8_t GT911_CONFIG_VERSION = 0x01;
static constexpr uint8_t GT911_MODULE_SWITCH1 = 0x00;
static constexpr uint8_t GT911_MODULE_SWITCH2 = 0x00;
static constexpr uint8_t GT911_SHAKE_COUNT    = 0x03;
static constexpr uint8_t GT911_CONFIG_FRESH   = 0x01;

static constexpr int GT911_MIN_TOUCH_POINTS = 1;
static constexpr int GT911_MAX_TOUCH_POINTS = 10;
static constexpr int GT911_MAX_RESOLUTION   = 4095;

// A raw 186-byte register image
using ConfigBlob = std::array<uint8_t, GT911_CONFIG_SIZE>;

enum class ByteOrder : uint8_t {
    None,          // single byte
    LittleEndian,
};

// Identifies every field stored in the image.
enum class Field : uint8_t {
    ConfigVersion,
    XMax,
    YMax,
    TouchPoints,
    ModuleSwitch1,
    ModuleSwitch2,
    ShakeCount,
    Filter,
    TouchThreshold,
    Checksum,
    ConfigFresh,
};

struct FieldSpec {
    Field       field;
    const char* name;
    std::size_t offset;
    std::size_t width;
    ByteOrder   order;
};

static constexpr std::size_t GT911_FIELD_COUNT = 11;

// The layout table. Entries are sorted by offset and never overlap.
extern const std::array<FieldSpec, GT911_FIELD_COUNT> kFieldLayout;

// Returns the layout entry for a field.
const FieldSpec& field_spec(Field f);

// Register address of a byte offset within the image.
constexpr uint16_t register_address(std::size_t offset) {
    return static_cast<uint16_t>(GT911_REG_BASE + offset);
}

// Read/write a field's value at its layout position.
// Single-byte fields truncate to the low 8 bits on write.
uint16_t read_field(const ConfigBlob& blob, Field f);
void     write_field(ConfigBlob& blob, Field f, uint16_t value);
