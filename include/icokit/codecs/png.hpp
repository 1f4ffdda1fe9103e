#ifndef ICOKIT_CODECS_PNG_HPP_
#define ICOKIT_CODECS_PNG_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>
#include <icokit/surface.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace icokit {

// ============================================================================
// PNG Decoder
// ============================================================================

class ICOKIT_EXPORT png_decoder {
public:
    static constexpr std::string_view name = "png";
    static constexpr std::string_view extensions[] = {".png"};

    /**
     * Check if data appears to be a PNG file.
     * @param data Raw file data
     * @return true if the signature matches PNG format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode PNG image data to an rgba8888 surface.
     * lodepng failures are reported as png_decode_failed.
     * @param data Raw file data
     * @param surf Destination surface
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode(std::span<const std::uint8_t> data,
                                               surface& surf,
                                               const decode_options& options = {});
};

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Encode a memory surface to PNG format.
 * @param surf Source surface
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] ICOKIT_EXPORT std::vector<std::uint8_t> encode_png(const memory_surface& surf);

/**
 * Save a memory surface to a PNG file.
 * @param surf Source surface
 * @param path Output file path
 * @return true on success
 */
[[nodiscard]] ICOKIT_EXPORT bool save_png(const memory_surface& surf,
                                          const std::filesystem::path& path);

} // namespace icokit

#endif // ICOKIT_CODECS_PNG_HPP_
