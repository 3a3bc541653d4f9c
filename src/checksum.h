#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "layout.h"

// Compute Config_Chksum over the first GT911_CHECKSUM_SPAN bytes.
// Formula: ((~sum(bytes[0..183])) + 1) & 0xFF
// i.e. the byte that makes sum(bytes[0..184]) == 0 (mod 256).
uint8_t compute_checksum(const uint8_t* data);
uint8_t compute_checksum(const ConfigBlob& blob);

// Recompute the checksum and compare it to the stored byte 184.
bool verify_checksum(const ConfigBlob& blob);

// Same, for an image read from disk.
// Throws BufferLengthError if data is not exactly GT911_CONFIG_SIZE bytes.
bool verify_checksum(const std::vector<uint8_t>& data);
