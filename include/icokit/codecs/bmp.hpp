#ifndef ICOKIT_CODECS_BMP_HPP_
#define ICOKIT_CODECS_BMP_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>
#include <icokit/surface.hpp>

#include <cstdint>
#include <span>
#include <string_view>

namespace icokit {

// ============================================================================
// BMP/DIB Decoder
// ============================================================================

class ICOKIT_EXPORT bmp_decoder {
public:
    static constexpr std::string_view name = "bmp";
    static constexpr std::string_view extensions[] = {".bmp", ".dib"};

    /**
     * Check if data appears to be a BMP file.
     * @param data Raw file data
     * @return true if the signature matches BMP format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode BMP image data to a surface.
     * Supports:
     *   - BITMAPINFOHEADER, BITMAPV4HEADER and BITMAPV5HEADER
     *   - 1, 4, 8, 24, and 32-bit color depths, uncompressed only
     *   - Top-down and bottom-up images
     *
     * 1/4/8-bit images are decoded to indexed8 with an opaque RGBA palette,
     * 24/32-bit images to rgba8888 (32-bit alpha is kept as stored).
     *
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

} // namespace icokit

#endif // ICOKIT_CODECS_BMP_HPP_
