#ifndef ICOKIT_TYPES_HPP_
#define ICOKIT_TYPES_HPP_

#include <icokit/icokit_export.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace icokit {

// ============================================================================
// Pixel Formats
// ============================================================================

enum class pixel_format {
    indexed8,   // 8-bit indices into an RGBA palette, up to 256 colors
    rgba8888    // 32-bit, 8-bit RGBA components
};

[[nodiscard]] constexpr std::size_t bytes_per_pixel(pixel_format fmt) noexcept {
    switch (fmt) {
        case pixel_format::indexed8: return 1;
        case pixel_format::rgba8888: return 4;
    }
    return 0;
}

struct rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    friend constexpr bool operator==(const rgba&, const rgba&) = default;
};

// ============================================================================
// Subrect Metadata (for multi-image containers)
// ============================================================================

struct image_rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct subrect {
    image_rect rect;
    std::uint32_t user_tag = 0;
};

// ============================================================================
// Decode Errors
// ============================================================================

enum class decode_error {
    none,
    invalid_format,
    invalid_container_header,
    invalid_signature,
    invalid_dimensions,
    unsupported_dib_header_size,
    unsupported_compression,
    unsupported_color_depth,
    dimensions_exceeded,
    truncated_data,
    png_decode_failed,
    io_error,
    internal_error
};

[[nodiscard]] ICOKIT_EXPORT const char* to_string(decode_error err) noexcept;

// ============================================================================
// Decode Result
// ============================================================================

struct decode_result {
    bool ok = false;
    decode_error error = decode_error::none;
    std::string message;

    [[nodiscard]] static decode_result success() {
        return {true, decode_error::none, {}};
    }

    [[nodiscard]] static decode_result failure(decode_error err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Maximum allowed dimensions (0 = use default)
    int max_width = 16384;
    int max_height = 16384;
};

} // namespace icokit

#endif // ICOKIT_TYPES_HPP_
