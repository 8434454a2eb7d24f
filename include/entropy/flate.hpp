#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace pdfimg {

inline constexpr size_t kUnlimitedOutput = std::numeric_limits<size_t>::max();

// zlib-format (RFC 1950) compression, the encoding behind PDF /FlateDecode.
// Implementations must be stateless so one instance can serve concurrent decodes.
class FlateCodec {
public:
    virtual ~FlateCodec() = default;

    // name is the diagnostic name attached to any DecodeError.
    virtual std::vector<uint8_t> compress(const std::vector<uint8_t>& raw,
                                          const std::string& name) const = 0;
    // Inflation stops once max_out bytes are produced; the rest of the stream
    // is neither inflated nor validated.
    virtual std::vector<uint8_t> decompress(const std::vector<uint8_t>& packed,
                                            const std::string& name,
                                            size_t max_out) const = 0;
};

class ZlibCodec : public FlateCodec {
public:
    explicit ZlibCodec(int level = -1) : level_(level) {}

    std::vector<uint8_t> compress(const std::vector<uint8_t>& raw,
                                  const std::string& name) const override;
    std::vector<uint8_t> decompress(const std::vector<uint8_t>& packed,
                                    const std::string& name,
                                    size_t max_out) const override;

private:
    int level_; // zlib level, -1 = Z_DEFAULT_COMPRESSION
};

const FlateCodec& default_flate_codec();

} // namespace pdfimg
