#include <icokit/codecs/bmp.hpp>
#include <icokit/codecs/dib.hpp>
#include "decode_helpers.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace icokit {

namespace {

// BMP signature: "BM"
constexpr std::uint8_t BMP_SIGNATURE[] = {'B', 'M'};

struct bmp_info {
    int width = 0;
    int height = 0;
    int bits_per_pixel = 0;
    std::uint32_t colors_used = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t header_size = 0;  // Info header size (not including file header)
    bool top_down = false;
};

decode_result parse_header(std::span<const std::uint8_t> data, bmp_info& info,
                           const decode_options& options) {
    dib_file_header file_header;
    auto result = parse_dib_file_header(data, file_header);
    if (!result) return result;

    dib_info_header header;
    result = parse_dib_info_header(data.subspan(DIB_FILE_HEADER_SIZE), header);
    if (!result) return result;

    // Widen before negating so INT32_MIN cannot overflow
    const std::int64_t abs_height = header.height < 0 ? -static_cast<std::int64_t>(header.height)
                                                      : static_cast<std::int64_t>(header.height);
    const auto [max_w, max_h] = get_dimension_limits(options);
    if (header.width > max_w || abs_height > max_h) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "Image dimensions exceed limits");
    }

    info.width = header.width;
    info.height = static_cast<int>(abs_height);
    info.top_down = header.height < 0;
    info.bits_per_pixel = header.bit_count;
    info.data_offset = file_header.data_offset;
    info.header_size = header.size;

    switch (info.bits_per_pixel) {
        case 1:
        case 4:
        case 8: {
            const std::uint32_t max_colors = 1u << info.bits_per_pixel;
            info.colors_used = header.clr_used == 0 ? max_colors
                                                    : std::min(header.clr_used, max_colors);
            break;
        }
        case 16:
            // Direct color, but no unpack rule for 5-5-5/5-6-5 pixels
            return decode_result::failure(decode_error::unsupported_color_depth,
                "16-bit bitmaps are not supported");
        case 24:
        case 32:
            info.colors_used = 0;
            break;
        default:
            return decode_result::failure(decode_error::unsupported_color_depth,
                "Unsupported bit depth: " + std::to_string(info.bits_per_pixel));
    }

    return decode_result::success();
}

// Read BGRX palette entries into opaque RGBA quadruples
decode_result read_palette(std::span<const std::uint8_t> data, const bmp_info& info,
                           std::vector<std::uint8_t>& palette) {
    const std::size_t palette_offset = DIB_FILE_HEADER_SIZE + info.header_size;
    const std::size_t palette_size = static_cast<std::size_t>(info.colors_used) * 4;

    if (palette_offset > data.size() || palette_size > data.size() - palette_offset) {
        return decode_result::failure(decode_error::truncated_data, "Bitmap palette is truncated");
    }

    palette.resize(palette_size);
    const std::uint8_t* pal_ptr = data.data() + palette_offset;
    for (std::uint32_t i = 0; i < info.colors_used; i++) {
        palette[i * 4 + 0] = pal_ptr[2];  // Red
        palette[i * 4 + 1] = pal_ptr[1];  // Green
        palette[i * 4 + 2] = pal_ptr[0];  // Blue
        palette[i * 4 + 3] = 0xFF;
        pal_ptr += 4;
    }
    return decode_result::success();
}

} // namespace

bool bmp_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < 2) {
        return false;
    }
    return data[0] == BMP_SIGNATURE[0] && data[1] == BMP_SIGNATURE[1];
}

decode_result bmp_decoder::decode(std::span<const std::uint8_t> data,
                                   surface& surf,
                                   const decode_options& options) {
    bmp_info info;
    auto result = parse_header(data, info, options);
    if (!result) return result;

    std::vector<std::uint8_t> palette;
    if (info.colors_used > 0) {
        result = read_palette(data, info, palette);
        if (!result) return result;
    }

    const pixel_format out_format = info.colors_used > 0 ? pixel_format::indexed8
                                                         : pixel_format::rgba8888;

    if (!surf.set_size(info.width, info.height, out_format)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    if (out_format == pixel_format::indexed8) {
        surf.set_palette_size(static_cast<int>(info.colors_used));
        surf.write_palette(0, palette);
    }

    if (info.data_offset > data.size()) {
        return decode_result::failure(decode_error::truncated_data, "Invalid data offset");
    }

    const std::uint8_t* pixel_data = data.data() + info.data_offset;
    const std::size_t pixel_data_size = data.size() - info.data_offset;

    // 24-bit rows are padded to 4 bytes; 32-bit rows are width * 4 already
    const std::size_t src_row_size = row_stride_4byte(info.width, info.bits_per_pixel);
    std::vector<std::uint8_t> row_buffer(static_cast<std::size_t>(info.width) * 4);

    for (int y = 0; y < info.height; y++) {
        const int src_y = info.top_down ? y : (info.height - 1 - y);
        const std::size_t row_offset = static_cast<std::size_t>(src_y) * src_row_size;

        if (row_offset + src_row_size > pixel_data_size) {
            return decode_result::failure(decode_error::truncated_data, "Unexpected end of data");
        }
        const std::uint8_t* src_row = pixel_data + row_offset;

        if (info.bits_per_pixel <= 8) {
            // Indexed mode
            for (int x = 0; x < info.width; x++) {
                row_buffer[x] = extract_pixel(src_row, x, info.bits_per_pixel);
            }
            surf.write_pixels(0, y, info.width, row_buffer.data());
        } else if (info.bits_per_pixel == 24) {
            // 24-bit BGR
            for (int x = 0; x < info.width; x++) {
                row_buffer[x * 4 + 0] = src_row[x * 3 + 2];  // R
                row_buffer[x * 4 + 1] = src_row[x * 3 + 1];  // G
                row_buffer[x * 4 + 2] = src_row[x * 3 + 0];  // B
                row_buffer[x * 4 + 3] = 0xFF;
            }
            surf.write_pixels(0, y, info.width * 4, row_buffer.data());
        } else {
            // 32-bit BGRA
            for (int x = 0; x < info.width; x++) {
                row_buffer[x * 4 + 0] = src_row[x * 4 + 2];  // R
                row_buffer[x * 4 + 1] = src_row[x * 4 + 1];  // G
                row_buffer[x * 4 + 2] = src_row[x * 4 + 0];  // B
                row_buffer[x * 4 + 3] = src_row[x * 4 + 3];  // A
            }
            surf.write_pixels(0, y, info.width * 4, row_buffer.data());
        }
    }

    return decode_result::success();
}

} // namespace icokit
