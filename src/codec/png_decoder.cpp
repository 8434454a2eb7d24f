#include "codec/png_decoder.hpp"

#include "codec/alpha_separator.hpp"
#include "codec/errors.hpp"
#include "format/png_format.hpp"
#include "io/byte_reader.hpp"

#include <algorithm>
#include <cstdio>
#include <istream>
#include <utility>
#include <vector>

namespace pdfimg {

namespace {

struct HeaderInfo {
    uint32_t width = 0;
    uint32_t height = 0;
    int bit_depth = 0;
    PngColorType color_type = PngColorType::Gray;
    ColorSpace color_space = ColorSpace::Gray;
};

static bool is_supported_bit_depth(int bpc) {
    return bpc == 1 || bpc == 2 || bpc == 4 || bpc == 8;
}

static HeaderInfo read_header(ByteReader& r) {
    const std::string& name = r.name();

    std::array<uint8_t, 8> sig{};
    for (auto& b : sig) b = r.read_u8();
    if (sig != kPngSignature) {
        throw DecodeError(ErrorCode::InvalidSignature, "Not a PNG file", name);
    }

    r.read_u32_be(); // IHDR length, always 13
    if (r.read_tag() != kTagIHDR) {
        throw DecodeError(ErrorCode::InvalidHeader, "Incorrect PNG file", name);
    }

    HeaderInfo h;
    h.width = r.read_u32_be();
    h.height = r.read_u32_be();
    if (h.width == 0 || h.height == 0) {
        throw DecodeError(ErrorCode::InvalidHeader,
                          "Invalid image size " + std::to_string(h.width) + "x" + std::to_string(h.height),
                          name);
    }

    h.bit_depth = r.read_u8();
    if (h.bit_depth > 8) {
        throw DecodeError(ErrorCode::UnsupportedBitDepth, "16-bit depth not supported", name);
    }
    if (!is_supported_bit_depth(h.bit_depth)) {
        throw DecodeError(ErrorCode::UnsupportedBitDepth,
                          "Invalid bit depth " + std::to_string(h.bit_depth), name);
    }

    const uint8_t ct = r.read_u8();
    switch (ct) {
    case 0: case 4: h.color_space = ColorSpace::Gray; break;
    case 2: case 6: h.color_space = ColorSpace::RGB; break;
    case 3:         h.color_space = ColorSpace::Indexed; break;
    default:
        throw DecodeError(ErrorCode::UnsupportedColorType,
                          "Unknown color type " + std::to_string(ct), name);
    }
    h.color_type = static_cast<PngColorType>(ct);
    // Alpha color types only exist at 8 and 16 bits.
    if (has_alpha_channel(h.color_type) && h.bit_depth != 8) {
        throw DecodeError(ErrorCode::UnsupportedBitDepth,
                          "Alpha channel requires 8-bit depth, got " + std::to_string(h.bit_depth), name);
    }

    if (r.read_u8() != kCompressionDeflate) {
        throw DecodeError(ErrorCode::UnsupportedCompression, "Unknown compression method", name);
    }
    if (r.read_u8() != kFilterAdaptive) {
        throw DecodeError(ErrorCode::UnsupportedFilter, "Unknown filter method", name);
    }
    if (r.read_u8() != kInterlaceNone) {
        throw DecodeError(ErrorCode::UnsupportedInterlacing, "Interlacing not supported", name);
    }

    r.skip(kChunkCrcBytes);
    return h;
}

static std::optional<Transparency> parse_transparency(const std::vector<uint8_t>& t,
                                                      PngColorType ct,
                                                      const std::string& name) {
    switch (ct) {
    case PngColorType::Gray:
        if (t.size() < 2) {
            throw DecodeError(ErrorCode::MalformedChunk, "tRNS too short for gray key", name);
        }
        return Transparency{Transparency::Kind::GrayKey, {t[1]}};
    case PngColorType::RGB:
        if (t.size() < 6) {
            throw DecodeError(ErrorCode::MalformedChunk, "tRNS too short for RGB key", name);
        }
        return Transparency{Transparency::Kind::RgbKey, {t[1], t[3], t[5]}};
    case PngColorType::Indexed: {
        // One alpha per palette entry, and a palette holds at most 256.
        if (t.size() > kMaxPaletteEntries) {
            throw DecodeError(ErrorCode::MalformedChunk,
                              "tRNS has " + std::to_string(t.size()) + " entries, palette allows 256", name);
        }
        auto it = std::find(t.begin(), t.end(), uint8_t{0});
        if (it == t.end()) return std::nullopt;
        const auto idx = static_cast<uint8_t>(it - t.begin());
        return Transparency{Transparency::Kind::Index, {idx}};
    }
    case PngColorType::GrayAlpha:
    case PngColorType::RGBA:
        break; // the soft mask carries transparency
    }
    return std::nullopt;
}

} // namespace

ImageDescriptor decode_png(std::istream& source,
                           const std::string& name,
                           const DecodeOptions& options) {
    ByteReader r(source, name);
    const HeaderInfo h = read_header(r);

    ImageDescriptor d;
    d.width = h.width;
    d.height = h.height;
    d.color_space = h.color_space;
    d.bits_per_component = h.bit_depth;
    d.decode_parameters.predictor = kPngPredictor;
    d.decode_parameters.colors = (h.color_space == ColorSpace::RGB) ? 3 : 1;
    d.decode_parameters.bits_per_component = h.bit_depth;
    d.decode_parameters.columns = h.width;

    // Scan chunks looking for palette, transparency and image data
    std::vector<uint8_t> data;
    while (true) {
        const uint32_t n = r.read_u32_be();
        const ChunkTag tag = r.read_tag();
        const ChunkType type = classify_chunk(tag);

#ifndef NDEBUG
        std::fprintf(stderr, "decode_png: %s chunk %.4s len=%u\n", name.c_str(), tag.data(), n);
#endif

        if (type == ChunkType::End) break;

        switch (type) {
        case ChunkType::Palette:
            d.palette = r.read_bytes(n);
            r.skip(kChunkCrcBytes);
            break;
        case ChunkType::Transparency: {
            const std::vector<uint8_t> t = r.read_bytes(n);
            d.transparency = parse_transparency(t, h.color_type, name);
            r.skip(kChunkCrcBytes);
            break;
        }
        case ChunkType::ImageData:
            r.read_append(data, n);
            r.skip(kChunkCrcBytes);
            break;
        case ChunkType::End:
        case ChunkType::Other:
            r.skip(static_cast<uint64_t>(n) + kChunkCrcBytes);
            break;
        }

        if (n == 0 && options.stop_at_empty_chunk) break;
    }

    if (d.color_space == ColorSpace::Indexed && d.palette.empty()) {
        throw DecodeError(ErrorCode::MissingPalette, "Missing palette", name);
    }

    if (has_alpha_channel(h.color_type)) {
        const int channels = (h.color_type == PngColorType::RGBA) ? 3 : 1;
        SeparatedPlanes planes = split_alpha(data, h.width, h.height, channels, options.codec, name);
        d.compressed_data = std::move(planes.color);
        d.soft_mask = std::move(planes.alpha);
        d.needs_alpha_support = true;
        d.minimum_pdf_version = kPdfVersionSoftMask;
    } else {
        d.compressed_data = std::move(data);
    }
    return d;
}

} // namespace pdfimg
