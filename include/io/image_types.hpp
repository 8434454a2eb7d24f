#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pdfimg {

enum class ColorSpace : uint8_t {
    Gray    = 1,
    RGB     = 2,
    Indexed = 3,
};

inline constexpr const char* kFlateFilterName = "FlateDecode";
inline constexpr int kPngPredictor = 15; // PNG predictor, chosen per row

// How a PDF consumer configures its flate filter to reverse PNG row prediction.
struct DecodeParameters {
    int predictor = kPngPredictor;
    int colors = 1;              // 3 for RGB, 1 otherwise
    int bits_per_component = 8;
    uint32_t columns = 0;        // image width in pixels
};

// Transparency key from a tRNS chunk.
// Indexed: one palette index. Gray: one sample. RGB: three samples.
struct Transparency {
    enum class Kind : uint8_t { Index, GrayKey, RgbKey };

    Kind kind = Kind::Index;
    std::vector<uint8_t> values;

    bool operator==(const Transparency& o) const { return kind == o.kind && values == o.values; }
    bool operator!=(const Transparency& o) const { return !(*this == o); }
};

struct PdfVersion {
    int major = 1;
    int minor = 3;

    std::string to_string() const { return std::to_string(major) + "." + std::to_string(minor); }
    bool operator<(const PdfVersion& o) const {
        return major != o.major ? major < o.major : minor < o.minor;
    }
    bool operator==(const PdfVersion& o) const { return major == o.major && minor == o.minor; }
};

inline constexpr PdfVersion kPdfVersionDefault{1, 3};
inline constexpr PdfVersion kPdfVersionSoftMask{1, 4};

// Everything a PDF image XObject needs, produced by one decode call.
struct ImageDescriptor {
    uint32_t width = 0;
    uint32_t height = 0;
    ColorSpace color_space = ColorSpace::Gray;
    int bits_per_component = 8;
    std::string filter_name = kFlateFilterName;
    DecodeParameters decode_parameters;

    std::vector<uint8_t> palette;             // raw RGB triples, Indexed only
    std::optional<Transparency> transparency;

    std::vector<uint8_t> compressed_data;     // zlib stream, PNG-predicted rows
    std::optional<std::vector<uint8_t>> soft_mask;

    // Applied by the document assembler; the decoder never touches document state.
    bool needs_alpha_support = false;
    PdfVersion minimum_pdf_version = kPdfVersionDefault;

    bool has_soft_mask() const { return soft_mask.has_value(); }
    size_t palette_entries() const { return palette.size() / 3; }
};

} // namespace pdfimg
