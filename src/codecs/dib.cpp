#include <icokit/codecs/dib.hpp>
#include "byte_io.hpp"

#include <string>

namespace icokit {

decode_result parse_dib_file_header(std::span<const std::uint8_t> data,
                                    dib_file_header& header) {
    if (data.size() < DIB_FILE_HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data,
            "Bitmap file header is truncated");
    }

    const std::uint8_t* p = data.data();
    if (p[0] != 'B' || p[1] != 'M') {
        return decode_result::failure(decode_error::invalid_signature,
            "Bitmap signature should be 'BM'");
    }

    header.signature[0] = p[0];
    header.signature[1] = p[1];
    header.file_size = read_le32(p + 2);
    header.reserved1 = read_le16(p + 6);
    header.reserved2 = read_le16(p + 8);
    header.data_offset = read_le32(p + 10);
    return decode_result::success();
}

decode_result parse_dib_info_header(std::span<const std::uint8_t> data,
                                    dib_info_header& header) {
    if (data.size() < 4) {
        return decode_result::failure(decode_error::truncated_data,
            "Bitmap info header is truncated");
    }

    const std::uint8_t* p = data.data();
    const std::uint32_t size = read_le32(p);
    if (size != DIB_INFO_HEADER_SIZE && size != DIB_V4_HEADER_SIZE && size != DIB_V5_HEADER_SIZE) {
        return decode_result::failure(decode_error::unsupported_dib_header_size,
            "Unsupported DIB header size: " + std::to_string(size));
    }

    if (data.size() < size) {
        return decode_result::failure(decode_error::truncated_data,
            "Bitmap info header is truncated");
    }

    const std::int32_t width = read_le32_signed(p + 4);
    if (width <= 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Bitmap width should be greater than zero (got " + std::to_string(width) + ")");
    }

    const std::int32_t height = read_le32_signed(p + DIB_HEIGHT_OFFSET);
    if (height == 0) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Bitmap height should be non-zero");
    }

    const std::uint32_t compression = read_le32(p + 16);
    if (compression != BI_RGB) {
        return decode_result::failure(decode_error::unsupported_compression,
            "Unsupported compression method: " + std::to_string(compression));
    }

    header.size = size;
    header.width = width;
    header.height = height;
    header.planes = read_le16(p + 12);
    header.bit_count = read_le16(p + 14);
    header.compression = compression;
    header.size_image = read_le32(p + 20);
    header.x_pels_per_meter = read_le32_signed(p + 24);
    header.y_pels_per_meter = read_le32_signed(p + 28);
    header.clr_used = read_le32(p + 32);
    header.clr_important = read_le32(p + 36);
    return decode_result::success();
}

void write_dib_file_header(std::vector<std::uint8_t>& out,
                           std::uint32_t file_size,
                           std::uint32_t data_offset) {
    out.push_back('B');
    out.push_back('M');
    write_le32(out, file_size);
    write_le16(out, 0);
    write_le16(out, 0);
    write_le32(out, data_offset);
}

void write_dib_info_header(std::vector<std::uint8_t>& out,
                           const dib_info_header& header) {
    write_le32(out, header.size);
    write_le32_signed(out, header.width);
    write_le32_signed(out, header.height);
    write_le16(out, header.planes);
    write_le16(out, header.bit_count);
    write_le32(out, header.compression);
    write_le32(out, header.size_image);
    write_le32_signed(out, header.x_pels_per_meter);
    write_le32_signed(out, header.y_pels_per_meter);
    write_le32(out, header.clr_used);
    write_le32(out, header.clr_important);
}

} // namespace icokit
