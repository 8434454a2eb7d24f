#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "format/png_format.hpp"

namespace pdfimg {

// Blocking big-endian reads over a caller-owned stream.
// Any short read or stream failure throws DecodeError(TruncatedStream)
// tagged with the diagnostic name.
class ByteReader {
public:
    ByteReader(std::istream& in, std::string name);

    uint8_t read_u8();
    uint32_t read_u32_be();
    ChunkTag read_tag();

    // Append exactly n bytes to out. Storage grows with the bytes actually
    // read, so a bogus declared length cannot force a huge allocation.
    void read_append(std::vector<uint8_t>& out, uint64_t n);
    std::vector<uint8_t> read_bytes(uint64_t n);
    void skip(uint64_t n);

    uint64_t consumed() const { return consumed_; }
    const std::string& name() const { return name_; }

private:
    void read_exact(void* out, size_t n);
    [[noreturn]] void fail_truncated(uint64_t wanted) const;

    std::istream& in_;
    std::string name_;
    uint64_t consumed_ = 0;
};

} // namespace pdfimg
