#include <icokit/codec.hpp>
#include <icokit/codecs/bmp.hpp>
#include <icokit/codecs/ico.hpp>
#include <icokit/codecs/png.hpp>

namespace icokit {

// ============================================================================
// Decoder Wrappers
// ============================================================================

namespace {

template <typename Codec>
class static_decoder_impl : public decoder {
public:
    [[nodiscard]] std::string_view name() const noexcept override {
        return Codec::name;
    }

    [[nodiscard]] std::span<const std::string_view> extensions() const noexcept override {
        return Codec::extensions;
    }

    [[nodiscard]] bool sniff(std::span<const std::uint8_t> data) const noexcept override {
        return Codec::sniff(data);
    }

    [[nodiscard]] decode_result decode(std::span<const std::uint8_t> data,
                                        surface& surf,
                                        const decode_options& options) const override {
        return Codec::decode(data, surf, options);
    }
};

using ico_decoder_impl = static_decoder_impl<ico_decoder>;
using bmp_decoder_impl = static_decoder_impl<bmp_decoder>;
using png_decoder_impl = static_decoder_impl<png_decoder>;

} // namespace

// ============================================================================
// Codec Registry Implementation
// ============================================================================

codec_registry& codec_registry::instance() {
    static codec_registry registry;
    return registry;
}

codec_registry::~codec_registry() = default;

void codec_registry::register_builtin_codecs() {
    if (builtins_registered_) {
        return;
    }
    builtins_registered_ = true;

    decoders_.push_back(std::make_unique<ico_decoder_impl>());
    decoders_.push_back(std::make_unique<bmp_decoder_impl>());
    decoders_.push_back(std::make_unique<png_decoder_impl>());
}

void codec_registry::register_decoder(std::unique_ptr<decoder> dec) {
    if (dec) {
        decoders_.push_back(std::move(dec));
    }
}

const decoder* codec_registry::find_decoder(std::span<const std::uint8_t> data) const {
    for (const auto& dec : decoders_) {
        if (dec->sniff(data)) {
            return dec.get();
        }
    }
    return nullptr;
}

const decoder* codec_registry::find_decoder(std::string_view name) const {
    for (const auto& dec : decoders_) {
        if (dec->name() == name) {
            return dec.get();
        }
    }
    return nullptr;
}

// ============================================================================
// Convenience Functions
// ============================================================================

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(data);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format, "Unknown image format");
    }
    return dec->decode(data, surf, options);
}

decode_result decode(std::span<const std::uint8_t> data,
                     surface& surf,
                     std::string_view codec_name,
                     const decode_options& options) {
    const auto* dec = codec_registry::instance().find_decoder(codec_name);
    if (!dec) {
        return decode_result::failure(decode_error::invalid_format,
            std::string("Unknown codec: ") + std::string(codec_name));
    }
    return dec->decode(data, surf, options);
}

} // namespace icokit
