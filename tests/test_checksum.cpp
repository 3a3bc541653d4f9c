#include "checksum.h"
#include "codec.h"
#include "layout.h"

#include <catch2/catch.hpp>

#include <vector>

// ============================================================================
// Checksum
// ============================================================================

TEST_CASE("Checksum: all-zero image", "[checksum]") {
    ConfigBlob b{};
    CHECK(compute_checksum(b) == 0x00);
    CHECK(verify_checksum(b));
}

TEST_CASE("Checksum: two's complement of the byte sum", "[checksum]") {
    ConfigBlob b{};
    b[0] = 0x01;
    CHECK(compute_checksum(b) == 0xFF);

    b[183] = 0x7F;  // sum 0x80
    CHECK(compute_checksum(b) == 0x80);

    b[100] = 0x80;  // sum 0x100 wraps to 0
    CHECK(compute_checksum(b) == 0x00);
}

TEST_CASE("Checksum: bytes 184 and 185 are not covered", "[checksum]") {
    ConfigBlob b{};
    b[10] = 0x33;
    uint8_t before = compute_checksum(b);
    b[184] = 0xAA;
    b[185] = 0x55;
    CHECK(compute_checksum(b) == before);
}

TEST_CASE("Checksum: any change to the covered range is detected", "[checksum]") {
    Settings s;
    ConfigBlob b = encode_config(s);
    REQUIRE(verify_checksum(b));

    for (std::size_t off : {0u, 1u, 13u, 100u, 183u}) {
        ConfigBlob m = b;
        m[off] ^= 0x01;
        INFO("offset " << off);
        CHECK_FALSE(verify_checksum(m));
    }
}

TEST_CASE("Checksum: verify on raw data checks the length", "[checksum]") {
    ConfigBlob b = encode_config(Settings{});
    std::vector<uint8_t> ok(b.begin(), b.end());
    CHECK(verify_checksum(ok));

    ok[184] ^= 0xFF;
    CHECK_FALSE(verify_checksum(ok));

    std::vector<uint8_t> short_buf(ok.begin(), ok.end() - 1);
    CHECK_THROWS_AS(verify_checksum(short_buf), BufferLengthError);
}

// ============================================================================
// Field layout
// ============================================================================

TEST_CASE("Layout: entries are sorted and never overlap", "[layout]") {
    for (std::size_t i = 0; i < kFieldLayout.size(); ++i) {
        const FieldSpec& f = kFieldLayout[i];
        INFO(f.name);
        CHECK(f.width >= 1);
        CHECK(f.offset + f.width <= GT911_CONFIG_SIZE);
        CHECK(static_cast<std::size_t>(f.field) == i);
        if (i > 0) {
            const FieldSpec& prev = kFieldLayout[i - 1];
            CHECK(prev.offset + prev.width <= f.offset);
        }
    }
}

TEST_CASE("Layout: register addresses", "[layout]") {
    CHECK(register_address(field_spec(Field::ConfigVersion).offset) == 0x8047);
    CHECK(register_address(field_spec(Field::YMax).offset) == 0x804A);
    CHECK(register_address(field_spec(Field::TouchThreshold).offset) == 0x8053);
    CHECK(register_address(field_spec(Field::Checksum).offset) == 0x80FF);
    CHECK(register_address(field_spec(Field::ConfigFresh).offset) == 0x8100);
}

TEST_CASE("Layout: 16-bit fields are little-endian", "[layout]") {
    ConfigBlob b{};
    write_field(b, Field::XMax, 0x0ABC);
    CHECK(b[1] == 0xBC);
    CHECK(b[2] == 0x0A);
    CHECK(read_field(b, Field::XMax) == 0x0ABC);
    CHECK(field_spec(Field::XMax).order == ByteOrder::LittleEndian);
}

TEST_CASE("Layout: single-byte fields truncate", "[layout]") {
    ConfigBlob b{};
    write_field(b, Field::Filter, 0x1234);
    CHECK(b[9] == 0x34);
    CHECK(b[10] == 0x00);
}
