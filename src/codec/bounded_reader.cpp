#include "codec/bounded_reader.hpp"

#include "codec/field_io.hpp"

#include <algorithm>
#include <array>
#include <istream>

namespace dfcompress::codec {

BoundedReader::BoundedReader(std::istream& input, std::uint64_t limit)
    : input_(input)
    , remaining_(limit)
{
}

std::size_t BoundedReader::read(std::uint8_t* buffer, std::size_t capacity)
{
    if (sourceEnded_ || remaining_ == 0U || capacity == 0U) {
        return 0;
    }

    const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining_, capacity));
    const auto received = readUpTo(input_, buffer, wanted);
    if (received < wanted) {
        sourceEnded_ = true;
    }

    remaining_ -= received;
    consumed_ += received;
    return received;
}

std::size_t BoundedReader::fill(std::uint8_t* buffer, std::size_t size)
{
    std::size_t total = 0;
    while (total < size) {
        const auto received = read(buffer + total, size - total);
        if (received == 0U) {
            break;
        }
        total += received;
    }
    return total;
}

std::uint64_t BoundedReader::skipRemaining()
{
    std::array<std::uint8_t, 4096> scratch {};
    std::uint64_t skipped = 0;
    while (true) {
        const auto received = read(scratch.data(), scratch.size());
        if (received == 0U) {
            break;
        }
        skipped += received;
    }
    return skipped;
}

std::uint64_t BoundedReader::consumed() const noexcept
{
    return consumed_;
}

std::uint64_t BoundedReader::remaining() const noexcept
{
    return remaining_;
}

bool BoundedReader::truncated() const noexcept
{
    return sourceEnded_ && remaining_ > 0U;
}

} // namespace dfcompress::codec
