#include "layout.h"

#include <stdexcept>

const std::array<FieldSpec, GT911_FIELD_COUNT> kFieldLayout = {{
    {Field::ConfigVersion,  "Config_Version",     0,   1, ByteOrder::None        },
    {Field::XMax,           "X Resolution",       1,   2, ByteOrder::LittleEndian},
    {Field::YMax,           "Y Resolution",       3,   2, ByteOrder::LittleEndian},
    {Field::TouchPoints,    "Touch Points",       5,   1, ByteOrder::None        },
    {Field::ModuleSwitch1,  "Module_Switch1",     6,   1, ByteOrder::None        },
    {Field::ModuleSwitch2,  "Module_Switch2",     7,   1, ByteOrder::None        },
    {Field::ShakeCount,     "Shake_Count",        8,   1, ByteOrder::None        },
    {Field::Filter,         "Filter",             9,   1, ByteOrder::None        },
    {Field::TouchThreshold, "Screen_Touch_Level", 12,  1, ByteOrder::None        },
    {Field::Checksum,       "Checksum",           184, 1, ByteOrder::None        },
    {Field::ConfigFresh,    "Config_Fresh",       185, 1, ByteOrder::None        },
}};

const FieldSpec& field_spec(Field f) {
    // The table is indexed by enum value.
    auto idx = static_cast<std::size_t>(f);
    if (idx >= kFieldLayout.size() || kFieldLayout[idx].field != f)
        throw std::logic_error("field layout table out of order");
    return kFieldLayout[idx];
}

uint16_t read_field(const ConfigBlob& blob, Field f) {
    const FieldSpec& s = field_spec(f);
    if (s.width == 2)
        return static_cast<uint16_t>(blob[s.offset] | (blob[s.offset + 1] << 8));
    return blob[s.offset];
}

void write_field(ConfigBlob& blob, Field f, uint16_t value) {
    const FieldSpec& s = field_spec(f);
    blob[s.offset] = static_cast<uint8_t>(value & 0xFF);
    if (s.width == 2)
        blob[s.offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}
