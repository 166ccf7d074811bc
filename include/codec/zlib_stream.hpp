#pragma once

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace dfcompress::codec {

class BoundedReader;

// Produces one complete zlib stream per call; the deflate state is reused between calls.
class ZlibDeflater {
public:
    explicit ZlibDeflater(int level = Z_DEFAULT_COMPRESSION);
    ~ZlibDeflater();

    ZlibDeflater(const ZlibDeflater&) = delete;
    ZlibDeflater& operator=(const ZlibDeflater&) = delete;

    std::vector<std::uint8_t> compress(const std::uint8_t* data, std::size_t size);

private:
    z_stream stream_ {};
};

class ZlibInflater {
public:
    ZlibInflater();
    ~ZlibInflater();

    ZlibInflater(const ZlibInflater&) = delete;
    ZlibInflater& operator=(const ZlibInflater&) = delete;

    // Inflates a single zlib stream pulled from `source` into `output`.
    // Input left in the bound after the end of the zlib stream is not consumed.
    std::uint64_t decompress(BoundedReader& source, std::ostream& output);

private:
    z_stream stream_ {};
};

} // namespace dfcompress::codec
