#ifndef ICOKIT_CODECS_DIB_HPP_
#define ICOKIT_CODECS_DIB_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace icokit {

// ============================================================================
// DIB Headers
// ============================================================================

// BITMAPFILEHEADER size on disk
constexpr std::size_t DIB_FILE_HEADER_SIZE = 14;

// BITMAPINFOHEADER size on disk (V4 and V5 headers extend it to 108 and 124)
constexpr std::uint32_t DIB_INFO_HEADER_SIZE = 40;
constexpr std::uint32_t DIB_V4_HEADER_SIZE = 108;
constexpr std::uint32_t DIB_V5_HEADER_SIZE = 124;

// Only uncompressed pixel data is decoded
constexpr std::uint32_t BI_RGB = 0;

// Offset of the height field inside the info header
constexpr std::size_t DIB_HEIGHT_OFFSET = 8;

struct dib_file_header {
    std::uint8_t signature[2] = {0, 0};
    std::uint32_t file_size = 0;
    std::uint16_t reserved1 = 0;
    std::uint16_t reserved2 = 0;
    std::uint32_t data_offset = 0;
};

struct dib_info_header {
    std::uint32_t size = 0;
    std::int32_t width = 0;
    std::int32_t height = 0;          // Negative = top-down rows
    std::uint16_t planes = 0;
    std::uint16_t bit_count = 0;
    std::uint32_t compression = 0;
    std::uint32_t size_image = 0;
    std::int32_t x_pels_per_meter = 0;
    std::int32_t y_pels_per_meter = 0;
    std::uint32_t clr_used = 0;
    std::uint32_t clr_important = 0;
};

/**
 * Parse a 14-byte BITMAPFILEHEADER.
 * Fails with truncated_data if fewer than 14 bytes are available and with
 * invalid_signature unless the stream starts with "BM".
 */
[[nodiscard]] ICOKIT_EXPORT decode_result parse_dib_file_header(std::span<const std::uint8_t> data,
                                                                 dib_file_header& header);

/**
 * Parse and validate an info header starting at data[0].
 *
 * Fields are checked in order, returning on the first violation:
 *   size in {40, 108, 124}   -> unsupported_dib_header_size
 *   width > 0                -> invalid_dimensions
 *   height != 0              -> invalid_dimensions
 *   compression == BI_RGB    -> unsupported_compression
 * A stream that ends inside the header fails with truncated_data.
 */
[[nodiscard]] ICOKIT_EXPORT decode_result parse_dib_info_header(std::span<const std::uint8_t> data,
                                                                 dib_info_header& header);

/**
 * Append a BITMAPFILEHEADER to out.
 */
ICOKIT_EXPORT void write_dib_file_header(std::vector<std::uint8_t>& out,
                                         std::uint32_t file_size,
                                         std::uint32_t data_offset);

/**
 * Append a 40-byte BITMAPINFOHEADER built from header to out.
 * header.size is written as given.
 */
ICOKIT_EXPORT void write_dib_info_header(std::vector<std::uint8_t>& out,
                                         const dib_info_header& header);

} // namespace icokit

#endif // ICOKIT_CODECS_DIB_HPP_
