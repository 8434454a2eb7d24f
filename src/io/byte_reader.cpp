#include "io/byte_reader.hpp"

#include "codec/errors.hpp"

#include <algorithm>
#include <istream>
#include <utility>

namespace pdfimg {

namespace {
constexpr size_t kReadBlockBytes = 64 * 1024;
} // namespace

ByteReader::ByteReader(std::istream& in, std::string name)
    : in_(in), name_(std::move(name)) {}

void ByteReader::fail_truncated(uint64_t wanted) const {
    throw DecodeError(ErrorCode::TruncatedStream,
                      "Unexpected end of stream at offset " + std::to_string(consumed_) +
                          " (wanted " + std::to_string(wanted) + " more bytes)",
                      name_);
}

void ByteReader::read_exact(void* out, size_t n) {
    if (n == 0) return;
    in_.read(static_cast<char*>(out), static_cast<std::streamsize>(n));
    const auto got = static_cast<size_t>(in_.gcount());
    consumed_ += got;
    if (got != n) fail_truncated(n - got);
}

uint8_t ByteReader::read_u8() {
    uint8_t v = 0;
    read_exact(&v, 1);
    return v;
}

uint32_t ByteReader::read_u32_be() {
    uint8_t b[4];
    read_exact(b, 4);
    return (static_cast<uint32_t>(b[0]) << 24) |
           (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) |
           static_cast<uint32_t>(b[3]);
}

ChunkTag ByteReader::read_tag() {
    ChunkTag tag{};
    read_exact(tag.data(), tag.size());
    return tag;
}

void ByteReader::read_append(std::vector<uint8_t>& out, uint64_t n) {
    while (n > 0) {
        const size_t step = static_cast<size_t>(std::min<uint64_t>(n, kReadBlockBytes));
        const size_t old_size = out.size();
        out.resize(old_size + step);
        in_.read(reinterpret_cast<char*>(out.data() + old_size), static_cast<std::streamsize>(step));
        const auto got = static_cast<size_t>(in_.gcount());
        consumed_ += got;
        if (got != step) {
            out.resize(old_size + got);
            fail_truncated(n - got);
        }
        n -= step;
    }
}

std::vector<uint8_t> ByteReader::read_bytes(uint64_t n) {
    std::vector<uint8_t> out;
    read_append(out, n);
    return out;
}

void ByteReader::skip(uint64_t n) {
    char scratch[4096];
    while (n > 0) {
        const size_t step = static_cast<size_t>(std::min<uint64_t>(n, sizeof(scratch)));
        read_exact(scratch, step);
        n -= step;
    }
}

} // namespace pdfimg
