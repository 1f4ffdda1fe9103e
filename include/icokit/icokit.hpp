#ifndef ICOKIT_ICOKIT_HPP_
#define ICOKIT_ICOKIT_HPP_

#include <icokit/icokit_export.h>
#include <icokit/types.hpp>
#include <icokit/surface.hpp>
#include <icokit/codec.hpp>
#include <icokit/codecs/dib.hpp>
#include <icokit/codecs/bmp.hpp>
#include <icokit/codecs/png.hpp>
#include <icokit/codecs/ico.hpp>

namespace icokit {

// All public API is included via the headers above.
// See:
//   - types.hpp:       pixel_format, rgba, decode_error, decode_result, decode_options
//   - surface.hpp:     surface interface, memory_surface
//   - codec.hpp:       decoder, codec_registry, decode()
//   - codecs/dib.hpp:  bitmap file/info header parsing and writing
//   - codecs/*.hpp:    bmp, png and ico codecs

} // namespace icokit

#endif // ICOKIT_ICOKIT_HPP_
