#ifndef ICOKIT_SURFACE_HPP_
#define ICOKIT_SURFACE_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace icokit {

// ============================================================================
// Surface Interface
// ============================================================================

/**
 * Abstract base class for image surfaces.
 * Decoders write pixels to surfaces, allowing framework-agnostic decoding.
 *
 * Implement this interface to integrate with your rendering framework
 * (e.g., SDL_Surface, SDL_Texture, OpenGL texture, etc.)
 */
class ICOKIT_EXPORT surface {
public:
    virtual ~surface() = default;

    /**
     * Set the surface dimensions and pixel format.
     * Called before any pixel writes. Clears pixels, palette and subrects.
     * @param width Image width in pixels
     * @param height Image height in pixels
     * @param format Pixel format
     * @return true if allocation succeeded
     */
    virtual bool set_size(int width, int height, pixel_format format) = 0;

    /**
     * Write a horizontal run of pixel data.
     *
     * NOTE: The x parameter is a BYTE OFFSET within the row, not a pixel coordinate.
     * For RGBA, use x = pixel_x * 4.
     *
     * @param x Starting byte offset within the row (NOT pixel coordinate)
     * @param y Y coordinate (row number)
     * @param count Number of bytes to write
     * @param pixels Pointer to pixel data
     */
    virtual void write_pixels(int x, int y, int count, const std::uint8_t* pixels) = 0;

    /**
     * Set the palette size (for indexed formats).
     * @param count Number of palette entries (max 256)
     */
    virtual void set_palette_size(int count) { (void)count; }

    /**
     * Write palette entries.
     * @param start Starting palette index
     * @param colors RGBA quadruples (4 bytes per color)
     */
    virtual void write_palette(int start, std::span<const std::uint8_t> colors) {
        (void)start;
        (void)colors;
    }

    /**
     * Set a subrect for multi-image containers.
     * @param index Subrect index
     * @param sr Subrect metadata
     */
    virtual void set_subrect(int index, const subrect& sr) {
        (void)index;
        (void)sr;
    }
};

// ============================================================================
// Memory Surface (default implementation)
// ============================================================================

/**
 * Simple in-memory surface implementation.
 * Stores pixels in a contiguous buffer with optional RGBA palette.
 */
class ICOKIT_EXPORT memory_surface : public surface {
public:
    memory_surface() = default;
    ~memory_surface() override = default;

    memory_surface(const memory_surface&) = delete;
    memory_surface& operator=(const memory_surface&) = delete;
    memory_surface(memory_surface&&) noexcept = default;
    memory_surface& operator=(memory_surface&&) noexcept = default;

    // Surface interface
    bool set_size(int width, int height, pixel_format format) override;
    void write_pixels(int x, int y, int count, const std::uint8_t* pixels) override;
    void set_palette_size(int count) override;
    void write_palette(int start, std::span<const std::uint8_t> colors) override;
    void set_subrect(int index, const subrect& sr) override;

    /**
     * Resolve the color of one pixel.
     * Indexed pixels are looked up in the palette; an index past the end of
     * the palette yields opaque black. Out-of-bounds coordinates yield
     * transparent black.
     */
    [[nodiscard]] rgba pixel_at(int x, int y) const noexcept;

    // Accessors (read-only)
    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] pixel_format format() const noexcept { return format_; }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }
    [[nodiscard]] std::span<const std::uint8_t> palette() const noexcept { return palette_; }
    [[nodiscard]] std::size_t palette_size() const noexcept { return palette_.size() / 4; }
    [[nodiscard]] const std::vector<subrect>& subrects() const noexcept { return subrects_; }
    [[nodiscard]] std::size_t pitch() const noexcept { return pitch_; }

    // Mutable accessors (for post-decode manipulation)
    [[nodiscard]] std::span<std::uint8_t> mutable_pixels() noexcept { return pixels_; }
    [[nodiscard]] std::span<std::uint8_t> mutable_palette() noexcept { return palette_; }

private:
    std::vector<std::uint8_t> pixels_;
    std::vector<std::uint8_t> palette_;  // RGBA quadruples
    std::vector<subrect> subrects_;
    int width_ = 0;
    int height_ = 0;
    std::size_t pitch_ = 0;
    pixel_format format_ = pixel_format::rgba8888;
};

} // namespace icokit

#endif // ICOKIT_SURFACE_HPP_
