#include "codec/xobject_fields.hpp"

#include <gtest/gtest.h>

namespace pdfimg {
namespace {

TEST(XObjectFieldsTest, ColorSpaceNames) {
    EXPECT_STREQ("DeviceGray", pdf_color_space_name(ColorSpace::Gray));
    EXPECT_STREQ("DeviceRGB", pdf_color_space_name(ColorSpace::RGB));
    EXPECT_STREQ("Indexed", pdf_color_space_name(ColorSpace::Indexed));
}

TEST(XObjectFieldsTest, DecodeParms) {
    DecodeParameters dp;
    dp.colors = 3;
    dp.bits_per_component = 8;
    dp.columns = 640;
    EXPECT_EQ("/Predictor 15 /Colors 3 /BitsPerComponent 8 /Columns 640", decode_parms_string(dp));
}

TEST(XObjectFieldsTest, MaskArrays) {
    EXPECT_EQ("[0 0]", mask_array(Transparency{Transparency::Kind::Index, {0}}));
    EXPECT_EQ("[255 255 0 0 12 12]", mask_array(Transparency{Transparency::Kind::RgbKey, {255, 0, 12}}));
}

TEST(XObjectFieldsTest, PdfVersionOrdering) {
    EXPECT_TRUE(kPdfVersionDefault < kPdfVersionSoftMask);
    EXPECT_FALSE(kPdfVersionSoftMask < kPdfVersionDefault);
    EXPECT_EQ("1.3", kPdfVersionDefault.to_string());
}

} // namespace
} // namespace pdfimg
