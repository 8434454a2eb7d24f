#pragma once

#include <iosfwd>
#include <string>

#include "entropy/flate.hpp"
#include "io/image_types.hpp"

namespace pdfimg {

struct DecodeOptions {
    // Needed only for images with an alpha channel; null makes those fail
    // with CodecUnavailable.
    const FlateCodec* codec = &default_flate_codec();

    // true: a zero-length chunk other than IEND ends the chunk scan.
    // false: scan until IEND; running out of input first is TruncatedStream.
    bool stop_at_empty_chunk = true;
};

// Read a PNG stream positioned at its signature and build the descriptor a
// PDF image XObject needs. name is used only in error messages.
// Throws DecodeError on any failure; the stream is left wherever reading stopped.
ImageDescriptor decode_png(std::istream& source,
                           const std::string& name,
                           const DecodeOptions& options = {});

} // namespace pdfimg
