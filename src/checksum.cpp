#include "checksum.h"

#include "codec.h"

// -----------------------------------------------------------------------
// Checksum
// -----------------------------------------------------------------------

uint8_t compute_checksum(const uint8_t* data) {
    // GT911 datasheet: Config_Chksum is the complement of the byte sum
    // of 0x8047..0x80FE plus one.
    uint32_t s = 0;
    for (std::size_t i = 0; i < GT911_CHECKSUM_SPAN; ++i)
        s += data[i];
    uint8_t sum8 = static_cast<uint8_t>(s & 0xFF);
    return static_cast<uint8_t>((~sum8 + 1) & 0xFF);
}

uint8_t compute_checksum(const ConfigBlob& blob) {
    return compute_checksum(blob.data());
}

bool verify_checksum(const ConfigBlob& blob) {
    return compute_checksum(blob) == read_field(blob, Field::Checksum);
}

bool verify_checksum(const std::vector<uint8_t>& data) {
    if (data.size() != GT911_CONFIG_SIZE)
        throw BufferLengthError(data.size());
    return compute_checksum(data.data()) ==
           data[field_spec(Field::Checksum).offset];
}
