#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>

namespace dfcompress::codec {

// Read cursor that never takes more than `limit` bytes from the shared stream,
// so a chunk decoder cannot run past its own chunk boundary.
class BoundedReader {
public:
    BoundedReader(std::istream& input, std::uint64_t limit);

    BoundedReader(const BoundedReader&) = delete;
    BoundedReader& operator=(const BoundedReader&) = delete;

    // Returns 0 once the bound is exhausted or the underlying stream ended.
    std::size_t read(std::uint8_t* buffer, std::size_t capacity);

    // Reads until `size` bytes arrived, the bound is exhausted or the stream ended.
    std::size_t fill(std::uint8_t* buffer, std::size_t size);

    // Drops whatever is left inside the bound.
    std::uint64_t skipRemaining();

    std::uint64_t consumed() const noexcept;
    std::uint64_t remaining() const noexcept;

    // True when the underlying stream ended before the bound was reached.
    bool truncated() const noexcept;

private:
    std::istream& input_;
    std::uint64_t remaining_ {0};
    std::uint64_t consumed_ {0};
    bool sourceEnded_ {false};
};

} // namespace dfcompress::codec
