#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "entropy/flate.hpp"

namespace pdfimg {

struct SeparatedPlanes {
    std::vector<uint8_t> color; // compressed, color_channels samples per pixel
    std::vector<uint8_t> alpha; // compressed, one sample per pixel
};

// Size of height rows of [filter][(color_channels + 1) samples] x width,
// saturating at UINT64_MAX.
uint64_t raw_scanline_bytes(uint32_t width, uint32_t height, int color_channels);

// De-interleave raw (decompressed) 8-bit scanlines.
// Row layout in:  [filter][c0..c{n-1},a] x width
// Row layout out: [filter][c0..c{n-1}] x width  and  [filter][a] x width
// The filter byte is copied to both planes so each stays decodable with the
// same PNG predictor. Bytes past height rows are ignored.
void deinterleave_alpha(const std::vector<uint8_t>& raw,
                        uint32_t width,
                        uint32_t height,
                        int color_channels,
                        std::vector<uint8_t>& color_out,
                        std::vector<uint8_t>& alpha_out,
                        const std::string& name);

// Inflate the concatenated IDAT payload, split off alpha, deflate both planes.
// color_channels is 1 (gray+alpha) or 3 (RGB+alpha). A null codec is
// CodecUnavailable.
SeparatedPlanes split_alpha(const std::vector<uint8_t>& compressed,
                            uint32_t width,
                            uint32_t height,
                            int color_channels,
                            const FlateCodec* codec,
                            const std::string& name);

} // namespace pdfimg
