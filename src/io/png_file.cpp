#include "io/png_file.hpp"

#include <fstream>
#include <stdexcept>

namespace pdfimg {

void write_all(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream ofs(path, std::ios::binary);
    if (!ofs.good()) throw std::runtime_error("Cannot write file: " + path);
    ofs.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!ofs.good()) throw std::runtime_error("Write failed: " + path);
}

ImageDescriptor decode_png_file(const std::string& path, const DecodeOptions& options) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw std::runtime_error("Can't open image file: " + path);
    return decode_png(ifs, path, options);
}

} // namespace pdfimg
