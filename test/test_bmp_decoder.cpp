#include <doctest/doctest.h>
#include <icokit/icokit.hpp>

#include "helpers/image_builder.hpp"

#include <vector>

using test_helpers::bytes;
using test_helpers::info_fields;
using test_helpers::make_bmp;

namespace {

constexpr icokit::rgba BLACK{0, 0, 0, 0xFF};
constexpr icokit::rgba WHITE{0xFF, 0xFF, 0xFF, 0xFF};
constexpr icokit::rgba RED{0xFF, 0, 0, 0xFF};
constexpr icokit::rgba BLUE{0, 0, 0xFF, 0xFF};

// Black/white BGRX palette
const bytes MONO_PALETTE = {0x00, 0x00, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0x00};

info_fields fields_2x2(std::uint16_t bit_count, bool top_down = false) {
    info_fields fields;
    fields.width = 2;
    fields.height = top_down ? -2 : 2;
    fields.bit_count = bit_count;
    return fields;
}

icokit::decode_result decode_bmp(const bytes& data, icokit::memory_surface& surf) {
    return icokit::bmp_decoder::decode(data, surf);
}

} // namespace

TEST_CASE("BMP decoder: sniff") {
    SUBCASE("Valid BMP signature") {
        std::vector<std::uint8_t> data = {'B', 'M', 0x00, 0x00};
        CHECK(icokit::bmp_decoder::sniff(data));
    }

    SUBCASE("Invalid signature") {
        std::vector<std::uint8_t> data = {'P', 'N', 'G', 0x00};
        CHECK_FALSE(icokit::bmp_decoder::sniff(data));
    }

    SUBCASE("Too short") {
        std::vector<std::uint8_t> data = {'B'};
        CHECK_FALSE(icokit::bmp_decoder::sniff(data));
    }
}

TEST_CASE("BMP decoder: 1-bit checkerboard") {
    // Stored rows: [1,0] then [0,1], MSB first, padded to 4 bytes
    const bytes rows = {0x80, 0, 0, 0,
                        0x40, 0, 0, 0};

    SUBCASE("Bottom-up") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(1), MONO_PALETTE, rows), surf).ok);
        CHECK(surf.width() == 2);
        CHECK(surf.height() == 2);
        CHECK(surf.format() == icokit::pixel_format::indexed8);
        CHECK(surf.palette_size() == 2);
        CHECK(surf.pixel_at(0, 0) == BLACK);
        CHECK(surf.pixel_at(1, 0) == WHITE);
        CHECK(surf.pixel_at(0, 1) == WHITE);
        CHECK(surf.pixel_at(1, 1) == BLACK);
    }

    SUBCASE("Top-down") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(1, true), MONO_PALETTE, rows), surf).ok);
        CHECK(surf.height() == 2);
        CHECK(surf.pixel_at(0, 0) == WHITE);
        CHECK(surf.pixel_at(1, 0) == BLACK);
        CHECK(surf.pixel_at(0, 1) == BLACK);
        CHECK(surf.pixel_at(1, 1) == WHITE);
    }
}

TEST_CASE("BMP decoder: 1-bit row wider than one byte") {
    // 10 pixels: 1010101010, second byte holds the last two pixels
    info_fields fields;
    fields.width = 10;
    fields.height = 1;
    fields.bit_count = 1;
    const bytes rows = {0xAA, 0x80, 0, 0};

    icokit::memory_surface surf;
    REQUIRE(decode_bmp(make_bmp(fields, MONO_PALETTE, rows), surf).ok);
    for (int x = 0; x < 10; ++x) {
        INFO("x = ", x);
        CHECK(surf.pixel_at(x, 0) == (x % 2 == 0 ? WHITE : BLACK));
    }
}

TEST_CASE("BMP decoder: 4-bit checkerboard") {
    // 16-entry palette; index 3 = red, index 10 = blue
    bytes palette(16 * 4, 0);
    palette[3 * 4 + 2] = 0xFF;
    palette[10 * 4 + 0] = 0xFF;

    // High nibble first: [3,10] then [10,3]
    const bytes rows = {0x3A, 0, 0, 0,
                        0xA3, 0, 0, 0};

    SUBCASE("Bottom-up") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(4), palette, rows), surf).ok);
        CHECK(surf.palette_size() == 16);
        CHECK(surf.pixel_at(0, 0) == BLUE);
        CHECK(surf.pixel_at(1, 0) == RED);
        CHECK(surf.pixel_at(0, 1) == RED);
        CHECK(surf.pixel_at(1, 1) == BLUE);
    }

    SUBCASE("Top-down") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(4, true), palette, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == RED);
        CHECK(surf.pixel_at(1, 0) == BLUE);
        CHECK(surf.pixel_at(0, 1) == BLUE);
        CHECK(surf.pixel_at(1, 1) == RED);
    }
}

TEST_CASE("BMP decoder: 8-bit checkerboard with colors-used palette") {
    auto fields = fields_2x2(8);
    fields.clr_used = 2;
    // Palette entry 0 = red, entry 1 = blue; reserved byte must not leak into alpha
    const bytes palette = {0x00, 0x00, 0xFF, 0x7F,
                           0xFF, 0x00, 0x00, 0x7F};
    const bytes rows = {1, 0, 0, 0,
                        0, 1, 0, 0};

    SUBCASE("Bottom-up") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields, palette, rows), surf).ok);
        CHECK(surf.palette_size() == 2);
        CHECK(surf.pixel_at(0, 0) == RED);
        CHECK(surf.pixel_at(1, 0) == BLUE);
        CHECK(surf.pixel_at(0, 1) == BLUE);
        CHECK(surf.pixel_at(1, 1) == RED);
    }

    SUBCASE("Top-down") {
        fields.height = -2;
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields, palette, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == BLUE);
        CHECK(surf.pixel_at(1, 0) == RED);
        CHECK(surf.pixel_at(0, 1) == RED);
        CHECK(surf.pixel_at(1, 1) == BLUE);
    }
}

TEST_CASE("BMP decoder: 24-bit checkerboard") {
    // BGR pixels, rows padded from 6 to 8 bytes
    const bytes rows = {0x00, 0x00, 0xFF,  0xFF, 0x00, 0x00,  0, 0,
                        0xFF, 0x00, 0x00,  0x00, 0x00, 0xFF,  0, 0};

    SUBCASE("Bottom-up") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(24), {}, rows), surf).ok);
        CHECK(surf.format() == icokit::pixel_format::rgba8888);
        CHECK(surf.pixel_at(0, 0) == BLUE);
        CHECK(surf.pixel_at(1, 0) == RED);
        CHECK(surf.pixel_at(0, 1) == RED);
        CHECK(surf.pixel_at(1, 1) == BLUE);
    }

    SUBCASE("Top-down") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(24, true), {}, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == RED);
        CHECK(surf.pixel_at(1, 0) == BLUE);
        CHECK(surf.pixel_at(0, 1) == BLUE);
        CHECK(surf.pixel_at(1, 1) == RED);
    }
}

TEST_CASE("BMP decoder: 32-bit keeps stored alpha") {
    const icokit::rgba half_red{0xFF, 0x00, 0x00, 0x80};
    const icokit::rgba clear_blue{0x00, 0x00, 0xFF, 0x00};

    // BGRA pixels
    const bytes rows = {0x00, 0x00, 0xFF, 0x80,  0xFF, 0x00, 0x00, 0x00,
                        0xFF, 0x00, 0x00, 0x00,  0x00, 0x00, 0xFF, 0x80};

    SUBCASE("Bottom-up") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(32), {}, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == clear_blue);
        CHECK(surf.pixel_at(1, 0) == half_red);
        CHECK(surf.pixel_at(0, 1) == half_red);
        CHECK(surf.pixel_at(1, 1) == clear_blue);
    }

    SUBCASE("Top-down") {
        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields_2x2(32, true), {}, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == half_red);
        CHECK(surf.pixel_at(1, 0) == clear_blue);
    }
}

TEST_CASE("BMP decoder: V4 and V5 info headers") {
    const bytes rows = {0x80, 0, 0, 0,
                        0x40, 0, 0, 0};

    for (std::uint32_t header_size : {108u, 124u}) {
        INFO("header size ", header_size);
        auto fields = fields_2x2(1);
        fields.size = header_size;

        icokit::memory_surface surf;
        REQUIRE(decode_bmp(make_bmp(fields, MONO_PALETTE, rows), surf).ok);
        CHECK(surf.pixel_at(0, 0) == BLACK);
        CHECK(surf.pixel_at(1, 0) == WHITE);
    }
}

TEST_CASE("BMP decoder: header errors") {
    const bytes rows(16, 0);
    icokit::memory_surface surf;

    SUBCASE("Wrong signature") {
        auto data = make_bmp(fields_2x2(24), {}, rows);
        data[1] = 'A';
        auto result = decode_bmp(data, surf);
        CHECK_FALSE(result.ok);
        CHECK(result.error == icokit::decode_error::invalid_signature);
    }

    SUBCASE("Shorter than the file header") {
        const bytes data = {'B', 'M', 0, 0, 0};
        CHECK(decode_bmp(data, surf).error == icokit::decode_error::truncated_data);
    }

    SUBCASE("Unsupported header size") {
        for (std::uint32_t header_size : {12u, 52u, 56u, 64u}) {
            INFO("header size ", header_size);
            auto fields = fields_2x2(24);
            fields.size = header_size;
            auto data = make_bmp(fields, {}, rows);
            CHECK(decode_bmp(data, surf).error == icokit::decode_error::unsupported_dib_header_size);
        }
    }

    SUBCASE("Zero width") {
        auto fields = fields_2x2(24);
        fields.width = 0;
        CHECK(decode_bmp(make_bmp(fields, {}, rows), surf).error == icokit::decode_error::invalid_dimensions);
    }

    SUBCASE("Negative width") {
        auto fields = fields_2x2(24);
        fields.width = -2;
        CHECK(decode_bmp(make_bmp(fields, {}, rows), surf).error == icokit::decode_error::invalid_dimensions);
    }

    SUBCASE("Zero height") {
        auto fields = fields_2x2(24);
        fields.height = 0;
        CHECK(decode_bmp(make_bmp(fields, {}, rows), surf).error == icokit::decode_error::invalid_dimensions);
    }

    SUBCASE("Compressed") {
        auto fields = fields_2x2(8);
        fields.compression = 1;  // RLE8
        CHECK(decode_bmp(make_bmp(fields, bytes(256 * 4, 0), rows), surf).error ==
              icokit::decode_error::unsupported_compression);
    }

    SUBCASE("Header size is checked before width") {
        auto fields = fields_2x2(24);
        fields.size = 12;
        fields.width = 0;
        CHECK(decode_bmp(make_bmp(fields, {}, rows), surf).error ==
              icokit::decode_error::unsupported_dib_header_size);
    }
}

TEST_CASE("BMP decoder: unsupported color depths") {
    const bytes rows(16, 0);
    icokit::memory_surface surf;

    for (std::uint16_t bpp : {16, 2, 0}) {
        INFO("bit depth ", bpp);
        auto result = decode_bmp(make_bmp(fields_2x2(bpp), {}, rows), surf);
        CHECK_FALSE(result.ok);
        CHECK(result.error == icokit::decode_error::unsupported_color_depth);
    }
}

TEST_CASE("BMP decoder: truncated pixel rows") {
    // Two 8-byte rows needed, one and a half provided
    const bytes rows(12, 0);
    icokit::memory_surface surf;

    SUBCASE("Bottom-up") {
        auto result = decode_bmp(make_bmp(fields_2x2(24), {}, rows), surf);
        CHECK_FALSE(result.ok);
        CHECK(result.error == icokit::decode_error::truncated_data);
    }

    SUBCASE("Top-down") {
        auto result = decode_bmp(make_bmp(fields_2x2(24, true), {}, rows), surf);
        CHECK(result.error == icokit::decode_error::truncated_data);
    }

    SUBCASE("Missing palette") {
        auto data = make_bmp(fields_2x2(8), {}, {});
        data.resize(14 + 40 + 100);  // 256-entry palette needs 1024 bytes
        CHECK(decode_bmp(data, surf).error == icokit::decode_error::truncated_data);
    }
}

TEST_CASE("BMP decoder: dimension limits") {
    info_fields fields;
    fields.width = 64;
    fields.height = 64;
    fields.bit_count = 24;
    const auto data = make_bmp(fields, {}, bytes(64 * 64 * 3, 0));

    icokit::decode_options options;
    options.max_width = 32;
    options.max_height = 32;

    icokit::memory_surface surf;
    auto result = icokit::bmp_decoder::decode(data, surf, options);
    CHECK(result.error == icokit::decode_error::dimensions_exceeded);

    CHECK(icokit::bmp_decoder::decode(data, surf).ok);
    CHECK(surf.width() == 64);
}
