#ifndef ICOKIT_CODECS_ICO_HPP_
#define ICOKIT_CODECS_ICO_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>
#include <icokit/surface.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace icokit {

// ============================================================================
// ICO Container Format
// ============================================================================

constexpr std::size_t ICO_HEADER_SIZE = 6;
constexpr std::size_t ICO_DIR_ENTRY_SIZE = 16;

// ICO file header
struct ico_header {
    std::uint16_t reserved = 0;   // Ignored
    std::uint16_t type = 0;       // Must be 1
    std::int16_t count = 0;       // Number of images, must be > 0
};

// ICO directory entry
struct ico_dir_entry {
    std::uint8_t width = 0;       // Width (0 = 256)
    std::uint8_t height = 0;      // Height (0 = 256)
    std::uint8_t color_count = 0; // Colors (0 if >= 8bpp)
    std::uint8_t reserved = 0;
    std::uint16_t planes = 0;
    std::uint16_t bit_count = 0;
    std::uint32_t size = 0;       // Payload size in bytes
    std::uint32_t offset = 0;     // Absolute payload offset in file

    [[nodiscard]] int pixel_width() const noexcept { return width == 0 ? 256 : width; }
    [[nodiscard]] int pixel_height() const noexcept { return height == 0 ? 256 : height; }
};

// Two self-contained bitmap files rebuilt from one headerless icon payload
struct ico_bitmap_pair {
    std::vector<std::uint8_t> xor_bitmap;  // Color image
    std::vector<std::uint8_t> and_bitmap;  // 1-bit transparency mask
};

/**
 * Parse the 6-byte container header.
 * Fails with invalid_container_header if type != 1 or count <= 0.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result parse_ico_header(std::span<const std::uint8_t> data,
                                                            ico_header& header);

/**
 * Read count directory entries following the container header.
 * data is the whole file; entries are read from offset 6 onward.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result parse_ico_directory(std::span<const std::uint8_t> data,
                                                               int count,
                                                               std::vector<ico_dir_entry>& entries);

/**
 * Locate one entry's payload inside the buffer that follows the header and
 * directory table. The entry's absolute offset is rebased by
 * 6 + 16 * count. Fails with truncated_data if the range leaves the buffer.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result locate_ico_payload(const ico_dir_entry& entry,
                                                              int count,
                                                              std::span<const std::uint8_t> buffer,
                                                              std::span<const std::uint8_t>& payload);

/**
 * True if bytes 1-3 of the payload spell "PNG".
 */
[[nodiscard]] ICOKIT_EXPORT bool is_png_payload(std::span<const std::uint8_t> payload) noexcept;

/**
 * Rebuild the XOR and AND bitmaps of a headerless icon payload as two
 * complete BMP files that bmp_decoder can decode independently.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result synthesize_ico_bitmaps(const ico_dir_entry& entry,
                                                                  std::span<const std::uint8_t> payload,
                                                                  ico_bitmap_pair& bitmaps);

/**
 * Combine a decoded color image with its decoded AND mask.
 *
 * The mask must be indexed with exactly two palette entries; entry 1 is made
 * fully transparent. The output starts fully transparent and receives the
 * color pixel wherever the mask entry is opaque.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result composite_ico_mask(const memory_surface& color,
                                                              memory_surface& mask,
                                                              memory_surface& out);

// ============================================================================
// ICO Decoder
// ============================================================================

/**
 * Decoder for Windows ICO (icon) files.
 *
 * Supports:
 * - 1, 4, 8, 24, and 32-bit uncompressed entries with AND masks
 * - PNG-compressed entries (Vista+ format)
 *
 * Output:
 * - decode_frames: one rgba8888 surface per directory entry, in directory order
 * - decode: vertically stacked atlas with one subrect per entry
 *   (subrect.user_tag = entry index)
 */
class ICOKIT_EXPORT ico_decoder {
public:
    static constexpr std::string_view name = "ico";
    static constexpr std::string_view extensions[] = {".ico"};

    /**
     * Check if data appears to be an ICO file.
     * @param data Raw file data
     * @return true if the header matches ICO format
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Decode every image in the container.
     *
     * Decoding is all-or-nothing: on failure frames is left empty.
     *
     * @param data Raw file data
     * @param frames Receives one surface per directory entry
     * @param options Decode options
     * @return Decode result with success/error status
     */
    [[nodiscard]] static decode_result decode_frames(std::span<const std::uint8_t> data,
                                                      std::vector<memory_surface>& frames,
                                                      const decode_options& options = {});

    /**
     * Decode ICO file to a surface.
     *
     * Creates a vertical atlas with all icons stacked. Each icon is
     * accessible via subrects.
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

#endif // ICOKIT_CODECS_ICO_HPP_
