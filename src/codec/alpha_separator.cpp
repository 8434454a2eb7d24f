#include "codec/alpha_separator.hpp"

#include "codec/errors.hpp"

#include <cstdio>
#include <limits>

namespace pdfimg {

uint64_t raw_scanline_bytes(uint32_t width, uint32_t height, int color_channels) {
    const uint64_t row_bytes = 1 + (static_cast<uint64_t>(color_channels) + 1) * width;
    if (height > std::numeric_limits<uint64_t>::max() / row_bytes) {
        return std::numeric_limits<uint64_t>::max();
    }
    return row_bytes * height;
}

void deinterleave_alpha(const std::vector<uint8_t>& raw,
                        uint32_t width,
                        uint32_t height,
                        int color_channels,
                        std::vector<uint8_t>& color_out,
                        std::vector<uint8_t>& alpha_out,
                        const std::string& name) {
    if (color_channels != 1 && color_channels != 3) {
        throw std::invalid_argument("deinterleave_alpha: color_channels must be 1 or 3");
    }
    const uint64_t pixel_bytes = static_cast<uint64_t>(color_channels) + 1;
    const uint64_t row_bytes = 1 + pixel_bytes * width;
    // Divide instead of multiplying: row_bytes * height can exceed 64 bits.
    if (row_bytes > raw.size() || height > raw.size() / row_bytes) {
        throw DecodeError(ErrorCode::CorruptImageData,
                          "Image data too short: " + std::to_string(raw.size()) + " bytes for " +
                              std::to_string(height) + " rows of " + std::to_string(row_bytes),
                          name);
    }

    color_out.clear();
    alpha_out.clear();
    color_out.reserve(static_cast<size_t>((1 + static_cast<uint64_t>(color_channels) * width) * height));
    alpha_out.reserve(static_cast<size_t>((1 + static_cast<uint64_t>(width)) * height));

    const size_t n = static_cast<size_t>(color_channels);
    for (uint32_t y = 0; y < height; ++y) {
        const uint8_t* row = raw.data() + static_cast<size_t>(row_bytes * y);
        color_out.push_back(row[0]);
        alpha_out.push_back(row[0]);

        const uint8_t* px = row + 1;
        for (uint32_t x = 0; x < width; ++x) {
            color_out.insert(color_out.end(), px, px + n);
            alpha_out.push_back(px[n]);
            px += n + 1;
        }
    }
}

SeparatedPlanes split_alpha(const std::vector<uint8_t>& compressed,
                            uint32_t width,
                            uint32_t height,
                            int color_channels,
                            const FlateCodec* codec,
                            const std::string& name) {
    if (!codec) {
        throw DecodeError(ErrorCode::CodecUnavailable,
                          "No flate codec available, can't handle alpha channel", name);
    }

    // Anything past the last row is never used, so don't inflate it.
    const uint64_t needed = raw_scanline_bytes(width, height, color_channels);
    const size_t max_out = needed > std::numeric_limits<size_t>::max()
                               ? std::numeric_limits<size_t>::max()
                               : static_cast<size_t>(needed);
    const std::vector<uint8_t> raw = codec->decompress(compressed, name, max_out);

    std::vector<uint8_t> color;
    std::vector<uint8_t> alpha;
    deinterleave_alpha(raw, width, height, color_channels, color, alpha, name);

#ifndef NDEBUG
    std::fprintf(stderr, "split_alpha: %s %ux%u raw=%zu color=%zu alpha=%zu\n",
                 name.c_str(), width, height, raw.size(), color.size(), alpha.size());
#endif

    SeparatedPlanes planes;
    planes.color = codec->compress(color, name);
    planes.alpha = codec->compress(alpha, name);
    return planes;
}

#ifndef NDEBUG
namespace {
// Self-test: one 2-pixel RGBA row splits into RGB and A with the filter byte kept.
struct AlphaSelfTest {
    AlphaSelfTest() {
        const std::vector<uint8_t> raw = {2, 10, 20, 30, 40, 50, 60, 70, 80};
        std::vector<uint8_t> color, alpha;
        deinterleave_alpha(raw, 2, 1, 3, color, alpha, "self-test");
        if (color != std::vector<uint8_t>{2, 10, 20, 30, 50, 60, 70} ||
            alpha != std::vector<uint8_t>{2, 40, 80}) {
            throw std::runtime_error("alpha self-test: de-interleave mismatch");
        }
    }
};
static AlphaSelfTest _alpha_self_test{};
} // namespace
#endif

} // namespace pdfimg
