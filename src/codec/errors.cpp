#include "codec/errors.hpp"

namespace pdfimg {

const char* error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidSignature:       return "InvalidSignature";
    case ErrorCode::InvalidHeader:          return "InvalidHeader";
    case ErrorCode::UnsupportedBitDepth:    return "UnsupportedBitDepth";
    case ErrorCode::UnsupportedColorType:   return "UnsupportedColorType";
    case ErrorCode::UnsupportedCompression: return "UnsupportedCompression";
    case ErrorCode::UnsupportedFilter:      return "UnsupportedFilter";
    case ErrorCode::UnsupportedInterlacing: return "UnsupportedInterlacing";
    case ErrorCode::MissingPalette:         return "MissingPalette";
    case ErrorCode::MalformedChunk:         return "MalformedChunk";
    case ErrorCode::CorruptImageData:       return "CorruptImageData";
    case ErrorCode::TruncatedStream:        return "TruncatedStream";
    case ErrorCode::CodecUnavailable:       return "CodecUnavailable";
    }
    return "Unknown";
}

bool is_format_violation(ErrorCode code) {
    return code != ErrorCode::TruncatedStream && code != ErrorCode::CodecUnavailable;
}

DecodeError::DecodeError(ErrorCode code, const std::string& message, const std::string& name)
    : std::runtime_error(message + ": " + name), code_(code), name_(name) {}

} // namespace pdfimg
