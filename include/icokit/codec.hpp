#ifndef ICOKIT_CODEC_HPP_
#define ICOKIT_CODEC_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>
#include <icokit/surface.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace icokit {

// ============================================================================
// Decoder Interface
// ============================================================================

/**
 * Abstract base class for image decoders.
 * Used by the codec registry for runtime polymorphism.
 */
class ICOKIT_EXPORT decoder {
public:
    virtual ~decoder() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual std::span<const std::string_view> extensions() const noexcept = 0;
    [[nodiscard]] virtual bool sniff(std::span<const std::uint8_t> data) const noexcept = 0;
    [[nodiscard]] virtual decode_result decode(std::span<const std::uint8_t> data,
                                                surface& surf,
                                                const decode_options& options) const = 0;
};

// ============================================================================
// Codec Registry
// ============================================================================

/**
 * Registry for image decoders.
 *
 * The registry starts empty. Call register_builtin_codecs() once during
 * process setup, before any lookups from other threads.
 */
class ICOKIT_EXPORT codec_registry {
public:
    /**
     * Get the global codec registry instance.
     */
    [[nodiscard]] static codec_registry& instance();

    /**
     * Register the built-in codecs (ico, bmp, png).
     * Idempotent: calls after the first one add nothing.
     */
    void register_builtin_codecs();

    /**
     * Register a decoder.
     * @param dec Unique pointer to decoder (ownership transferred)
     */
    void register_decoder(std::unique_ptr<decoder> dec);

    /**
     * Find decoder by sniffing data.
     * @param data Raw file data
     * @return Pointer to decoder if found, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder(std::span<const std::uint8_t> data) const;

    /**
     * Find decoder by name.
     * @param name Codec name (e.g., "ico")
     * @return Pointer to decoder if found, nullptr otherwise
     */
    [[nodiscard]] const decoder* find_decoder(std::string_view name) const;

    [[nodiscard]] std::size_t decoder_count() const noexcept {
        return decoders_.size();
    }

    [[nodiscard]] const decoder* decoder_at(std::size_t index) const noexcept {
        return index < decoders_.size() ? decoders_[index].get() : nullptr;
    }

private:
    codec_registry() = default;
    ~codec_registry();

    codec_registry(const codec_registry&) = delete;
    codec_registry& operator=(const codec_registry&) = delete;

    std::vector<std::unique_ptr<decoder>> decoders_;
    bool builtins_registered_ = false;
};

// ============================================================================
// Convenience Decode Functions
// ============================================================================

/**
 * Decode image data to a surface (auto-detect format).
 * @param data Raw file data
 * @param surf Destination surface
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] ICOKIT_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                  surface& surf,
                                                  const decode_options& options = {});

/**
 * Decode image data to a surface (explicit codec).
 * @param data Raw file data
 * @param surf Destination surface
 * @param codec_name Name of codec to use
 * @param options Decode options
 * @return Decode result
 */
[[nodiscard]] ICOKIT_EXPORT decode_result decode(std::span<const std::uint8_t> data,
                                                  surface& surf,
                                                  std::string_view codec_name,
                                                  const decode_options& options = {});

} // namespace icokit

#endif // ICOKIT_CODEC_HPP_
