#include "entropy/flate.hpp"

#include "codec/errors.hpp"

#include <algorithm>

#include <zlib.h>

namespace pdfimg {

std::vector<uint8_t> ZlibCodec::compress(const std::vector<uint8_t>& raw,
                                         const std::string& name) const {
    uLongf out_len = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> out(out_len);
    const int rc = compress2(out.data(), &out_len, raw.data(), static_cast<uLong>(raw.size()), level_);
    if (rc != Z_OK) {
        throw DecodeError(ErrorCode::CodecUnavailable,
                          std::string("zlib compress2 failed (") + zError(rc) + ")", name);
    }
    out.resize(out_len);
    return out;
}

std::vector<uint8_t> ZlibCodec::decompress(const std::vector<uint8_t>& packed,
                                           const std::string& name,
                                           size_t max_out) const {
    z_stream strm{};
    int rc = inflateInit(&strm);
    if (rc != Z_OK) {
        throw DecodeError(ErrorCode::CodecUnavailable,
                          std::string("zlib inflateInit failed (") + zError(rc) + ")", name);
    }

    strm.next_in = const_cast<Bytef*>(packed.data());
    strm.avail_in = static_cast<uInt>(packed.size());

    std::vector<uint8_t> out;
    out.reserve(std::min(packed.size() * 4, max_out));
    uint8_t buffer[16384];

    rc = Z_OK;
    while (rc != Z_STREAM_END && out.size() < max_out) {
        strm.next_out = buffer;
        strm.avail_out = static_cast<uInt>(std::min(sizeof(buffer), max_out - out.size()));
        rc = inflate(&strm, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            const std::string msg = strm.msg ? strm.msg : zError(rc);
            inflateEnd(&strm);
            throw DecodeError(ErrorCode::CorruptImageData, "zlib inflate failed (" + msg + ")", name);
        }
        const size_t produced = static_cast<size_t>(strm.next_out - buffer);
        out.insert(out.end(), buffer, buffer + produced);
        // Input exhausted without Z_STREAM_END: the stream is cut short.
        if (rc == Z_OK && strm.avail_in == 0 && produced == 0) {
            inflateEnd(&strm);
            throw DecodeError(ErrorCode::CorruptImageData, "zlib stream ends before its trailer", name);
        }
    }

    inflateEnd(&strm);
    return out;
}

const FlateCodec& default_flate_codec() {
    static const ZlibCodec codec;
    return codec;
}

} // namespace pdfimg
