#pragma once

#include <cstddef>
#include <cstdint>

namespace dfcompress::codec {

inline constexpr std::size_t kHeaderSize = 8;
inline constexpr std::size_t kChunkWindowSize = 20000;

enum class Compression : std::uint32_t {
    Raw = 0,
    Chunked = 1
};

struct Header {
    std::uint32_t version {0};
    Compression compression {Compression::Raw};
};

struct ConversionStats {
    Header input;
    Header output;
    std::uint64_t bodyBytes {0};
    std::uint64_t chunkCount {0};
    std::uint64_t bytesWritten {0};
    bool passthrough {false};
};

struct CompressOptions {
    int level {-1}; // zlib level, -1 selects Z_DEFAULT_COMPRESSION
};

} // namespace dfcompress::codec
