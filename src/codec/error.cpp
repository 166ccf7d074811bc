#include "codec/error.hpp"

namespace dfcompress::codec {

CodecError::CodecError(ErrorKind kind, const std::string& message, std::uint32_t compression)
    : std::runtime_error(message)
    , kind_(kind)
    , compression_(compression)
{
}

CodecError CodecError::compressionUnknown(std::uint32_t compression)
{
    return CodecError(ErrorKind::CompressionUnknown, "Unknown compression " + std::to_string(compression), compression);
}

CodecError CodecError::io(const std::string& message)
{
    return CodecError(ErrorKind::Io, message);
}

CodecError CodecError::unexpectedEof()
{
    return CodecError(ErrorKind::UnexpectedEof, "Unexpected end-of-file");
}

CodecError CodecError::versionIsZero()
{
    return CodecError(ErrorKind::VersionIsZero, "Version is 0");
}

ErrorKind CodecError::kind() const noexcept
{
    return kind_;
}

std::uint32_t CodecError::compression() const noexcept
{
    return compression_;
}

const char* toString(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::CompressionUnknown: return "CompressionUnknown";
    case ErrorKind::Io: return "Io";
    case ErrorKind::UnexpectedEof: return "UnexpectedEof";
    case ErrorKind::VersionIsZero: return "VersionIsZero";
    }
    return "Unknown";
}

} // namespace dfcompress::codec
