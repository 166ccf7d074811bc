#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>

namespace dfcompress::codec {

// Reads until `size` bytes arrived or the stream ended; returns the count read.
// Throws CodecError (Io) on any failure other than end of stream.
std::size_t readUpTo(std::istream& input, std::uint8_t* buffer, std::size_t size);

std::uint32_t readU32(std::istream& input);

// std::nullopt when the stream ends before the first byte of the field.
// A field cut short after 1-3 bytes is still an UnexpectedEof error.
std::optional<std::uint32_t> readU32OrEof(std::istream& input);

void writeU32(std::ostream& output, std::uint32_t value);
void writeBytes(std::ostream& output, const std::uint8_t* data, std::size_t size);

std::uint64_t copyStream(std::istream& input, std::ostream& output);

} // namespace dfcompress::codec
