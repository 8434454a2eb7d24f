#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "codec/png_decoder.hpp"
#include "io/image_types.hpp"

namespace pdfimg {

void write_all(const std::string& path, const std::vector<uint8_t>& bytes);

// Open path and decode it, using path as the diagnostic name.
// A file that cannot be opened is a std::runtime_error, not a DecodeError.
ImageDescriptor decode_png_file(const std::string& path, const DecodeOptions& options = {});

} // namespace pdfimg
