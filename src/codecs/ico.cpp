#include <icokit/codecs/ico.hpp>
#include <icokit/codecs/bmp.hpp>
#include <icokit/codecs/dib.hpp>
#include <icokit/codecs/png.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

namespace icokit {

namespace {

constexpr std::uint16_t ICO_TYPE_ICON = 1;

// Synthesized AND mask: 40-byte header, two-entry palette
constexpr std::uint32_t MASK_PALETTE_SIZE = 2 * 4;
constexpr std::uint8_t MASK_PALETTE[MASK_PALETTE_SIZE] = {
    0x00, 0x00, 0x00, 0x00,  // 0: black
    0xFF, 0xFF, 0xFF, 0x00   // 1: white
};

constexpr std::size_t directory_end(int count) {
    return ICO_HEADER_SIZE + ICO_DIR_ENTRY_SIZE * static_cast<std::size_t>(count);
}

std::string entry_label(const char* kind, std::size_t index) {
    return std::string(kind) + " entry " + std::to_string(index) + ": ";
}

// Synthesize, decode twice, composite
decode_result decode_bitmap_entry(const ico_dir_entry& entry,
                                  std::span<const std::uint8_t> payload,
                                  memory_surface& out,
                                  const decode_options& options) {
    ico_bitmap_pair bitmaps;
    auto result = synthesize_ico_bitmaps(entry, payload, bitmaps);
    if (!result) return result;

    memory_surface color;
    result = bmp_decoder::decode(bitmaps.xor_bitmap, color, options);
    if (!result) return result;

    memory_surface mask;
    result = bmp_decoder::decode(bitmaps.and_bitmap, mask, options);
    if (!result) return result;

    return composite_ico_mask(color, mask, out);
}

// Stack frames vertically into one surface
decode_result create_icon_atlas(const std::vector<memory_surface>& icons, surface& surf,
                                const decode_options& options) {
    const auto [max_w, max_h] = get_dimension_limits(options);

    std::size_t atlas_width = 0;
    std::size_t atlas_height = 0;
    for (const auto& icon : icons) {
        atlas_width = std::max(atlas_width, static_cast<std::size_t>(icon.width()));
        atlas_height += static_cast<std::size_t>(icon.height());

        // Early overflow check
        if (atlas_height > static_cast<std::size_t>(max_h)) {
            return decode_result::failure(decode_error::dimensions_exceeded,
                "ICO atlas height exceeds limits");
        }
    }

    if (atlas_width > static_cast<std::size_t>(max_w)) {
        return decode_result::failure(decode_error::dimensions_exceeded,
            "ICO atlas width exceeds limits");
    }

    if (!surf.set_size(static_cast<int>(atlas_width), static_cast<int>(atlas_height), pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    int y_offset = 0;
    for (std::size_t i = 0; i < icons.size(); ++i) {
        const auto& icon = icons[i];
        const auto src = icon.pixels();

        for (int y = 0; y < icon.height(); ++y) {
            surf.write_pixels(0, y_offset + y, static_cast<int>(icon.pitch()),
                              src.data() + static_cast<std::size_t>(y) * icon.pitch());
        }

        subrect sr;
        sr.rect = {0, y_offset, icon.width(), icon.height()};
        sr.user_tag = static_cast<std::uint32_t>(i);
        surf.set_subrect(static_cast<int>(i), sr);

        y_offset += icon.height();
    }

    return decode_result::success();
}

} // namespace

// ============================================================================
// Container Parser
// ============================================================================

decode_result parse_ico_header(std::span<const std::uint8_t> data, ico_header& header) {
    if (data.size() < ICO_HEADER_SIZE) {
        return decode_result::failure(decode_error::truncated_data, "ICO header is truncated");
    }

    const std::uint16_t type = read_le16(data.data() + 2);
    if (type != ICO_TYPE_ICON) {
        return decode_result::failure(decode_error::invalid_container_header,
            "ICO image type should be 1 (got " + std::to_string(type) + ")");
    }

    const std::int16_t count = read_le16_signed(data.data() + 4);
    if (count <= 0) {
        return decode_result::failure(decode_error::invalid_container_header,
            "Invalid number of images (got " + std::to_string(count) + ")");
    }

    header.reserved = read_le16(data.data());
    header.type = type;
    header.count = count;
    return decode_result::success();
}

decode_result parse_ico_directory(std::span<const std::uint8_t> data,
                                  int count,
                                  std::vector<ico_dir_entry>& entries) {
    if (count < 0 || data.size() < directory_end(count)) {
        return decode_result::failure(decode_error::truncated_data, "ICO directory is truncated");
    }

    entries.clear();
    entries.reserve(static_cast<std::size_t>(count));

    const std::uint8_t* p = data.data() + ICO_HEADER_SIZE;
    for (int i = 0; i < count; ++i, p += ICO_DIR_ENTRY_SIZE) {
        ico_dir_entry entry;
        entry.width = p[0];
        entry.height = p[1];
        entry.color_count = p[2];
        entry.reserved = p[3];
        entry.planes = read_le16(p + 4);
        entry.bit_count = read_le16(p + 6);
        entry.size = read_le32(p + 8);
        entry.offset = read_le32(p + 12);
        entries.push_back(entry);
    }

    return decode_result::success();
}

decode_result locate_ico_payload(const ico_dir_entry& entry,
                                 int count,
                                 std::span<const std::uint8_t> buffer,
                                 std::span<const std::uint8_t>& payload) {
    const std::size_t consumed = directory_end(count);
    if (entry.offset < consumed) {
        return decode_result::failure(decode_error::truncated_data,
            "Image offset points inside the ICO directory");
    }

    const std::size_t offset = entry.offset - consumed;
    if (offset > buffer.size() || entry.size > buffer.size() - offset) {
        return decode_result::failure(decode_error::truncated_data,
            "Image data extends past end of file");
    }

    payload = buffer.subspan(offset, entry.size);
    return decode_result::success();
}

// ============================================================================
// Format Dispatcher
// ============================================================================

bool is_png_payload(std::span<const std::uint8_t> payload) noexcept {
    return payload.size() >= 4 && payload[1] == 'P' && payload[2] == 'N' && payload[3] == 'G';
}

// ============================================================================
// Bitmap Header Synthesizer
// ============================================================================

decode_result synthesize_ico_bitmaps(const ico_dir_entry& entry,
                                     std::span<const std::uint8_t> payload,
                                     ico_bitmap_pair& bitmaps) {
    dib_info_header info;
    auto result = parse_dib_info_header(payload, info);
    if (!result) return result;

    // Info header height covers XOR and AND blocks together
    const std::int32_t image_height = info.height / 2;

    std::uint64_t palette_size = static_cast<std::uint64_t>(info.clr_used) * 4;
    if (palette_size == 0 && info.bit_count < 16) {
        palette_size = (std::uint64_t{1} << info.bit_count) * 4;
    }

    const std::uint64_t stride = row_stride_4byte(entry.pixel_width(), info.bit_count);
    const std::uint64_t xor_size = palette_size + stride * static_cast<std::uint64_t>(entry.pixel_height());

    const auto body = payload.subspan(info.size);
    if (xor_size > body.size()) {
        return decode_result::failure(decode_error::truncated_data,
            "Icon color bitmap extends past end of image data");
    }
    const auto xor_block = body.first(static_cast<std::size_t>(xor_size));
    const auto and_block = body.subspan(static_cast<std::size_t>(xor_size));

    // XOR: original header with the height halved, then palette and pixels
    auto& xor_bitmap = bitmaps.xor_bitmap;
    xor_bitmap.clear();
    xor_bitmap.reserve(DIB_FILE_HEADER_SIZE + info.size + xor_block.size());
    write_dib_file_header(xor_bitmap,
        static_cast<std::uint32_t>(DIB_FILE_HEADER_SIZE + info.size + xor_size),
        static_cast<std::uint32_t>(DIB_FILE_HEADER_SIZE + info.size + palette_size));
    xor_bitmap.insert(xor_bitmap.end(), payload.begin(), payload.begin() + info.size);
    store_le32(xor_bitmap.data() + DIB_FILE_HEADER_SIZE + DIB_HEIGHT_OFFSET,
               static_cast<std::uint32_t>(image_height));
    xor_bitmap.insert(xor_bitmap.end(), xor_block.begin(), xor_block.end());

    // AND: fresh monochrome header, fixed black/white palette, remaining bytes
    dib_info_header mask_info;
    mask_info.size = DIB_INFO_HEADER_SIZE;
    mask_info.width = info.width;
    mask_info.height = image_height;
    mask_info.planes = 1;
    mask_info.bit_count = 1;
    mask_info.compression = BI_RGB;

    auto& and_bitmap = bitmaps.and_bitmap;
    and_bitmap.clear();
    and_bitmap.reserve(DIB_FILE_HEADER_SIZE + DIB_INFO_HEADER_SIZE + MASK_PALETTE_SIZE + and_block.size());
    write_dib_file_header(and_bitmap,
        static_cast<std::uint32_t>(DIB_FILE_HEADER_SIZE + DIB_INFO_HEADER_SIZE + MASK_PALETTE_SIZE + and_block.size()),
        static_cast<std::uint32_t>(DIB_FILE_HEADER_SIZE + DIB_INFO_HEADER_SIZE + MASK_PALETTE_SIZE));
    write_dib_info_header(and_bitmap, mask_info);
    and_bitmap.insert(and_bitmap.end(), std::begin(MASK_PALETTE), std::end(MASK_PALETTE));
    and_bitmap.insert(and_bitmap.end(), and_block.begin(), and_block.end());

    return decode_result::success();
}

// ============================================================================
// Compositor
// ============================================================================

decode_result composite_ico_mask(const memory_surface& color,
                                 memory_surface& mask,
                                 memory_surface& out) {
    if (color.width() != mask.width() || color.height() != mask.height()) {
        return decode_result::failure(decode_error::invalid_dimensions,
            "Icon mask size does not match color image");
    }

    if (mask.format() != pixel_format::indexed8 || mask.palette_size() != 2) {
        return decode_result::failure(decode_error::internal_error,
            "Icon mask must be a two-color indexed image");
    }

    // Index 1 marks transparent pixels
    mask.mutable_palette()[1 * 4 + 3] = 0x00;

    if (!out.set_size(color.width(), color.height(), pixel_format::rgba8888)) {
        return decode_result::failure(decode_error::internal_error, "Failed to allocate surface");
    }

    const auto mask_pixels = mask.pixels();
    const auto mask_palette = mask.palette();
    std::vector<std::uint8_t> row(static_cast<std::size_t>(color.width()) * 4);

    for (int y = 0; y < color.height(); ++y) {
        std::fill(row.begin(), row.end(), 0);
        const std::uint8_t* mask_row = mask_pixels.data() + static_cast<std::size_t>(y) * mask.pitch();

        for (int x = 0; x < color.width(); ++x) {
            const std::size_t idx = mask_row[x];
            if (mask_palette[idx * 4 + 3] == 0) {
                continue;
            }
            const rgba c = color.pixel_at(x, y);
            row[x * 4 + 0] = c.r;
            row[x * 4 + 1] = c.g;
            row[x * 4 + 2] = c.b;
            row[x * 4 + 3] = c.a;
        }

        out.write_pixels(0, y, static_cast<int>(row.size()), row.data());
    }

    return decode_result::success();
}

// ============================================================================
// ICO Decoder
// ============================================================================

bool ico_decoder::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < ICO_HEADER_SIZE) return false;
    return read_le16(data.data()) == 0 &&
           read_le16(data.data() + 2) == ICO_TYPE_ICON &&
           read_le16_signed(data.data() + 4) > 0;
}

decode_result ico_decoder::decode_frames(std::span<const std::uint8_t> data,
                                         std::vector<memory_surface>& frames,
                                         const decode_options& options) {
    frames.clear();

    ico_header header;
    auto result = parse_ico_header(data, header);
    if (!result) return result;

    std::vector<ico_dir_entry> entries;
    result = parse_ico_directory(data, header.count, entries);
    if (!result) return result;

    const auto buffer = data.subspan(directory_end(header.count));

    std::vector<memory_surface> decoded;
    decoded.reserve(entries.size());

    for (std::size_t i = 0; i < entries.size(); ++i) {
        std::span<const std::uint8_t> payload;
        result = locate_ico_payload(entries[i], header.count, buffer, payload);
        if (!result) {
            return decode_result::failure(result.error, entry_label("Image", i) + result.message);
        }

        memory_surface frame;
        if (is_png_payload(payload)) {
            result = png_decoder::decode(payload, frame, options);
            if (!result) {
                return decode_result::failure(result.error, entry_label("PNG", i) + result.message);
            }
        } else {
            result = decode_bitmap_entry(entries[i], payload, frame, options);
            if (!result) {
                return decode_result::failure(result.error, entry_label("Bitmap", i) + result.message);
            }
        }

        decoded.push_back(std::move(frame));
    }

    frames = std::move(decoded);
    return decode_result::success();
}

decode_result ico_decoder::decode(std::span<const std::uint8_t> data,
                                  surface& surf,
                                  const decode_options& options) {
    std::vector<memory_surface> frames;
    auto result = decode_frames(data, frames, options);
    if (!result) return result;

    return create_icon_atlas(frames, surf, options);
}

} // namespace icokit
