#include "codec/header.hpp"

#include "codec/error.hpp"
#include "codec/field_io.hpp"

namespace dfcompress::codec {

Header readHeader(std::istream& input)
{
    Header header {};

    header.version = readU32(input);
    if (header.version == 0U) {
        throw CodecError::versionIsZero();
    }

    const auto compression = readU32(input);
    if (compression > static_cast<std::uint32_t>(Compression::Chunked)) {
        throw CodecError::compressionUnknown(compression);
    }
    header.compression = static_cast<Compression>(compression);

    return header;
}

void writeHeader(std::ostream& output, const Header& header)
{
    writeU32(output, header.version);
    writeU32(output, static_cast<std::uint32_t>(header.compression));
}

const char* toString(Compression compression) noexcept
{
    switch (compression) {
    case Compression::Raw: return "raw";
    case Compression::Chunked: return "chunked";
    }
    return "unknown";
}

} // namespace dfcompress::codec
