#include "codec/field_io.hpp"

#include "codec/error.hpp"

#include <array>
#include <istream>
#include <ostream>
#include <vector>

namespace dfcompress::codec {
namespace {

constexpr std::size_t kFieldSize = 4;
constexpr std::size_t kCopyBufferSize = 64 * 1024;

std::uint32_t decodeLittleEndian(const std::array<std::uint8_t, kFieldSize>& bytes)
{
    return static_cast<std::uint32_t>(bytes[0])
        | (static_cast<std::uint32_t>(bytes[1]) << 8U)
        | (static_cast<std::uint32_t>(bytes[2]) << 16U)
        | (static_cast<std::uint32_t>(bytes[3]) << 24U);
}

} // namespace

std::size_t readUpTo(std::istream& input, std::uint8_t* buffer, std::size_t size)
{
    if (input.bad() || (input.fail() && !input.eof())) {
        throw CodecError::io("Input stream is not readable");
    }
    if (size == 0U) {
        return 0;
    }

    input.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(size));
    if (input.bad()) {
        throw CodecError::io("Failed to read from input stream");
    }
    return static_cast<std::size_t>(input.gcount());
}

std::uint32_t readU32(std::istream& input)
{
    std::array<std::uint8_t, kFieldSize> bytes {};
    if (readUpTo(input, bytes.data(), bytes.size()) != bytes.size()) {
        throw CodecError::unexpectedEof();
    }
    return decodeLittleEndian(bytes);
}

std::optional<std::uint32_t> readU32OrEof(std::istream& input)
{
    std::array<std::uint8_t, kFieldSize> bytes {};
    const auto received = readUpTo(input, bytes.data(), bytes.size());
    if (received == 0U) {
        return std::nullopt;
    }
    if (received != bytes.size()) {
        throw CodecError::unexpectedEof();
    }
    return decodeLittleEndian(bytes);
}

void writeU32(std::ostream& output, std::uint32_t value)
{
    const std::uint8_t bytes[kFieldSize] = {
        static_cast<std::uint8_t>(value),
        static_cast<std::uint8_t>(value >> 8U),
        static_cast<std::uint8_t>(value >> 16U),
        static_cast<std::uint8_t>(value >> 24U),
    };
    writeBytes(output, bytes, sizeof(bytes));
}

void writeBytes(std::ostream& output, const std::uint8_t* data, std::size_t size)
{
    if (size == 0U) {
        return;
    }
    output.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!output) {
        throw CodecError::io("Failed to write to output stream");
    }
}

std::uint64_t copyStream(std::istream& input, std::ostream& output)
{
    std::vector<std::uint8_t> buffer(kCopyBufferSize);
    std::uint64_t total = 0;

    while (true) {
        const auto received = readUpTo(input, buffer.data(), buffer.size());
        if (received == 0U) {
            break;
        }
        writeBytes(output, buffer.data(), received);
        total += received;
    }

    return total;
}

} // namespace dfcompress::codec
