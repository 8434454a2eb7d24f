#pragma once

#include <string>

#include "io/image_types.hpp"

namespace pdfimg {

// Helpers a PDF writer uses to turn an ImageDescriptor into image XObject
// dictionary entries. Names are returned without the leading '/'.

// DeviceGray / DeviceRGB / Indexed
const char* pdf_color_space_name(ColorSpace cs);

// "/Predictor 15 /Colors 3 /BitsPerComponent 8 /Columns 640"
std::string decode_parms_string(const DecodeParameters& dp);

// Color-key /Mask array, each value given as its own [min max] range:
// "[0 0]" or "[255 255 0 0 12 12]".
std::string mask_array(const Transparency& t);

} // namespace pdfimg
