#include "format/png_format.hpp"

namespace pdfimg {

ChunkType classify_chunk(const ChunkTag& tag) {
    if (tag == kTagPLTE) return ChunkType::Palette;
    if (tag == kTagTRNS) return ChunkType::Transparency;
    if (tag == kTagIDAT) return ChunkType::ImageData;
    if (tag == kTagIEND) return ChunkType::End;
    return ChunkType::Other;
}

} // namespace pdfimg
