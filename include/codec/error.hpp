#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace dfcompress::codec {

enum class ErrorKind {
    CompressionUnknown,
    Io,
    UnexpectedEof,
    VersionIsZero
};

class CodecError : public std::runtime_error {
public:
    static CodecError compressionUnknown(std::uint32_t compression);
    static CodecError io(const std::string& message);
    static CodecError unexpectedEof();
    static CodecError versionIsZero();

    ErrorKind kind() const noexcept;

    // Offending header tag, only meaningful for ErrorKind::CompressionUnknown.
    std::uint32_t compression() const noexcept;

private:
    CodecError(ErrorKind kind, const std::string& message, std::uint32_t compression = 0);

    ErrorKind kind_;
    std::uint32_t compression_ {0};
};

const char* toString(ErrorKind kind) noexcept;

} // namespace dfcompress::codec
