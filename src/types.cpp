#include <icokit/types.hpp>

namespace icokit {

const char* to_string(decode_error err) noexcept {
    switch (err) {
        case decode_error::none:                        return "none";
        case decode_error::invalid_format:              return "invalid_format";
        case decode_error::invalid_container_header:    return "invalid_container_header";
        case decode_error::invalid_signature:           return "invalid_signature";
        case decode_error::invalid_dimensions:          return "invalid_dimensions";
        case decode_error::unsupported_dib_header_size: return "unsupported_dib_header_size";
        case decode_error::unsupported_compression:     return "unsupported_compression";
        case decode_error::unsupported_color_depth:     return "unsupported_color_depth";
        case decode_error::dimensions_exceeded:         return "dimensions_exceeded";
        case decode_error::truncated_data:              return "truncated_data";
        case decode_error::png_decode_failed:           return "png_decode_failed";
        case decode_error::io_error:                    return "io_error";
        case decode_error::internal_error:              return "internal_error";
    }
    return "unknown";
}

} // namespace icokit
