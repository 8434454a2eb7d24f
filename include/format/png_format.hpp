#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace pdfimg {

// PNG stream layout:
// [Signature 8][IHDR chunk][chunk...][IEND chunk]
//
// Every chunk is [length u32 BE][tag 4][payload length][crc u32 BE].
// Multi-byte fields are big-endian.
inline constexpr std::array<uint8_t, 8> kPngSignature = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
};

inline constexpr uint32_t kChunkCrcBytes = 4;

using ChunkTag = std::array<char, 4>;

inline constexpr ChunkTag kTagIHDR = {'I', 'H', 'D', 'R'};
inline constexpr ChunkTag kTagPLTE = {'P', 'L', 'T', 'E'};
inline constexpr ChunkTag kTagTRNS = {'t', 'R', 'N', 'S'};
inline constexpr ChunkTag kTagIDAT = {'I', 'D', 'A', 'T'};
inline constexpr ChunkTag kTagIEND = {'I', 'E', 'N', 'D'};

// Chunks the decoder interprets; everything else is Other and skipped.
enum class ChunkType : uint8_t {
    Palette,
    Transparency,
    ImageData,
    End,
    Other,
};

ChunkType classify_chunk(const ChunkTag& tag);

// IHDR color type field.
enum class PngColorType : uint8_t {
    Gray      = 0,
    RGB       = 2,
    Indexed   = 3,
    GrayAlpha = 4,
    RGBA      = 6,
};

inline constexpr uint8_t kCompressionDeflate = 0;
inline constexpr uint8_t kFilterAdaptive = 0;
inline constexpr uint8_t kInterlaceNone = 0;

inline constexpr size_t kMaxPaletteEntries = 256;

inline bool has_alpha_channel(PngColorType ct) {
    return ct == PngColorType::GrayAlpha || ct == PngColorType::RGBA;
}

} // namespace pdfimg
