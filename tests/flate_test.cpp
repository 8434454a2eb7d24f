#include "codec/errors.hpp"
#include "entropy/flate.hpp"
#include "png_test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace pdfimg {
namespace {

using testing::Bytes;

TEST(FlateTest, CompressProducesZlibStream) {
    Bytes raw(5000);
    for (size_t i = 0; i < raw.size(); ++i) raw[i] = static_cast<uint8_t>(i % 7);
    const Bytes packed = default_flate_codec().compress(raw, "mem");
    ASSERT_GE(packed.size(), 2u);
    EXPECT_EQ(0x78, packed[0]); // deflate, 32K window
    EXPECT_EQ(0, ((packed[0] << 8) | packed[1]) % 31);
    EXPECT_LT(packed.size(), raw.size());
    EXPECT_EQ(raw, testing::zlib_decompress(packed));
}

TEST(FlateTest, DecompressLargerThanInternalBuffer) {
    const Bytes raw(100000, 0x5A);
    EXPECT_EQ(raw, default_flate_codec().decompress(testing::zlib_compress(raw), "mem", kUnlimitedOutput));
}

TEST(FlateTest, CompressEmpty) {
    const Bytes packed = ZlibCodec(9).compress({}, "mem");
    EXPECT_TRUE(testing::zlib_decompress(packed).empty());
}

TEST(FlateTest, GarbageIsCorruptImageData) {
    try {
        default_flate_codec().decompress({0x00, 0x01, 0x02, 0x03}, "garbage.png", kUnlimitedOutput);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(ErrorCode::CorruptImageData, e.code());
        EXPECT_EQ("garbage.png", e.name());
    }
}

TEST(FlateTest, CutStreamIsCorruptImageData) {
    Bytes packed = testing::zlib_compress(Bytes(4096, 1));
    packed.resize(packed.size() / 2);
    EXPECT_THROW(default_flate_codec().decompress(packed, "cut", kUnlimitedOutput), DecodeError);
}

TEST(FlateTest, EmptyInputIsCorruptImageData) {
    EXPECT_THROW(default_flate_codec().decompress({}, "empty", kUnlimitedOutput), DecodeError);
}

TEST(FlateTest, OutputCapStopsInflating) {
    Bytes raw(8 * 1024 * 1024);
    for (size_t i = 0; i < raw.size(); ++i) raw[i] = static_cast<uint8_t>(i % 251);
    const Bytes packed = testing::zlib_compress(raw);

    const Bytes head = default_flate_codec().decompress(packed, "cap", 20000);
    ASSERT_EQ(20000u, head.size());
    EXPECT_TRUE(std::equal(head.begin(), head.end(), raw.begin()));

    EXPECT_TRUE(default_flate_codec().decompress(packed, "cap", 0).empty());
}

TEST(FlateTest, OutputCapAboveStreamSizeReturnsWholeStream) {
    const Bytes raw(300, 7);
    EXPECT_EQ(raw, default_flate_codec().decompress(testing::zlib_compress(raw), "cap", 1000));
}

} // namespace
} // namespace pdfimg
