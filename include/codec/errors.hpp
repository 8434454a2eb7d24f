#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace pdfimg {

enum class ErrorCode : uint8_t {
    InvalidSignature,
    InvalidHeader,
    UnsupportedBitDepth,
    UnsupportedColorType,
    UnsupportedCompression,
    UnsupportedFilter,
    UnsupportedInterlacing,
    MissingPalette,
    MalformedChunk,
    CorruptImageData,
    TruncatedStream,
    CodecUnavailable,
};

const char* error_code_name(ErrorCode code);

// False for source exhaustion and a missing codec, true for everything the
// stream itself got wrong.
bool is_format_violation(ErrorCode code);

// Fatal decode failure. what() reads "<message>: <name>".
class DecodeError : public std::runtime_error {
public:
    DecodeError(ErrorCode code, const std::string& message, const std::string& name);

    ErrorCode code() const { return code_; }
    const std::string& name() const { return name_; }

private:
    ErrorCode code_;
    std::string name_;
};

} // namespace pdfimg
