#include "cli/pnginfo.hpp"
#include "png_test_utils.hpp"

#include "io/png_file.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <vector>

namespace pdfimg {
namespace {

namespace fs = std::filesystem;
using testing::Bytes;

class PngInfoTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("pdfimg_pnginfo_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string Path(const std::string& leaf) const { return (dir_ / leaf).string(); }

    int Run(std::vector<std::string> args) {
        args.insert(args.begin(), "pnginfo");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(&a[0]);
        out_.str("");
        err_.str("");
        return run_pnginfo(static_cast<int>(argv.size()), argv.data(), out_, err_);
    }

    std::string WriteRgba() {
        testing::IhdrFields f;
        f.width = 2;
        f.height = 1;
        f.color_type = 6;
        testing::PngBuilder png;
        png.signature().ihdr(f).chunk("IDAT", testing::zlib_compress({0, 1, 2, 3, 200, 4, 5, 6, 100})).iend();
        const std::string path = Path("rgba.png");
        write_all(path, png.bytes());
        return path;
    }

    fs::path dir_;
    std::ostringstream out_;
    std::ostringstream err_;
};

TEST_F(PngInfoTest, PrintsDescriptor) {
    testing::IhdrFields f;
    f.width = 4;
    f.height = 3;
    f.color_type = 3;
    testing::PngBuilder png;
    png.signature().ihdr(f).chunk("PLTE", Bytes(6, 1)).chunk("tRNS", {0}).chunk("IDAT", {1, 2}).iend();
    write_all(Path("pal.png"), png.bytes());

    ASSERT_EQ(0, Run({"--in", Path("pal.png")}));
    const std::string text = out_.str();
    EXPECT_NE(std::string::npos, text.find("Width: 4\n"));
    EXPECT_NE(std::string::npos, text.find("Height: 3\n"));
    EXPECT_NE(std::string::npos, text.find("ColorSpace: /Indexed (2 entries)\n"));
    EXPECT_NE(std::string::npos, text.find("DecodeParms: << /Predictor 15 /Colors 1 /BitsPerComponent 8 /Columns 4 >>\n"));
    EXPECT_NE(std::string::npos, text.find("Mask: [0 0]\n"));
    EXPECT_NE(std::string::npos, text.find("Data: 2 bytes\n"));
    EXPECT_EQ(std::string::npos, text.find("SMask"));
    EXPECT_NE(std::string::npos, text.find("MinimumPdfVersion: 1.3\n"));
    EXPECT_TRUE(err_.str().empty());
}

TEST_F(PngInfoTest, WritesColorAndSoftMaskStreams) {
    const std::string in = WriteRgba();
    ASSERT_EQ(0, Run({"--in", in, "--data", Path("c.bin"), "--smask", Path("a.bin")}));
    EXPECT_NE(std::string::npos, out_.str().find("MinimumPdfVersion: 1.4\n"));
    EXPECT_EQ((Bytes{0, 1, 2, 3, 4, 5, 6}), testing::zlib_decompress(testing::read_file(Path("c.bin"))));
    EXPECT_EQ((Bytes{0, 200, 100}), testing::zlib_decompress(testing::read_file(Path("a.bin"))));
}

TEST_F(PngInfoTest, MissingInputIsUsageError) {
    EXPECT_EQ(1, Run({}));
    EXPECT_NE(std::string::npos, err_.str().find("Usage: pnginfo"));
    EXPECT_EQ(1, Run({"--in"}));
}

TEST_F(PngInfoTest, StrayArgumentIsUsageError) {
    const std::string in = WriteRgba();
    EXPECT_EQ(1, Run({"--strict-chunks", in}));
    EXPECT_NE(std::string::npos, err_.str().find("Usage: pnginfo"));
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(PngInfoTest, DecodeErrorExitsTwo) {
    write_all(Path("bad.png"), Bytes(32, 0));
    EXPECT_EQ(2, Run({"--in", Path("bad.png")}));
    EXPECT_NE(std::string::npos, err_.str().find("[ERROR] InvalidSignature"));
}

TEST_F(PngInfoTest, MissingFileExitsTwo) {
    EXPECT_EQ(2, Run({"--in", Path("absent.png")}));
    EXPECT_NE(std::string::npos, err_.str().find("absent.png"));
}

} // namespace
} // namespace pdfimg
