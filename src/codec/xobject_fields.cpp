#include "codec/xobject_fields.hpp"

#include <sstream>

namespace pdfimg {

const char* pdf_color_space_name(ColorSpace cs) {
    switch (cs) {
    case ColorSpace::Gray:    return "DeviceGray";
    case ColorSpace::RGB:     return "DeviceRGB";
    case ColorSpace::Indexed: return "Indexed";
    }
    return "DeviceGray";
}

std::string decode_parms_string(const DecodeParameters& dp) {
    std::ostringstream os;
    os << "/Predictor " << dp.predictor
       << " /Colors " << dp.colors
       << " /BitsPerComponent " << dp.bits_per_component
       << " /Columns " << dp.columns;
    return os.str();
}

std::string mask_array(const Transparency& t) {
    std::ostringstream os;
    os << '[';
    for (size_t i = 0; i < t.values.size(); ++i) {
        const int v = t.values[i];
        if (i) os << ' ';
        os << v << ' ' << v;
    }
    os << ']';
    return os.str();
}

} // namespace pdfimg
