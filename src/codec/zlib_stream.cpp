#include "codec/zlib_stream.hpp"

#include "codec/bounded_reader.hpp"
#include "codec/error.hpp"
#include "codec/field_io.hpp"

#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace dfcompress::codec {
namespace {

constexpr std::size_t kInflateBufferSize = 16384;

std::string describe(const z_stream& stream, int status)
{
    if (stream.msg != nullptr) {
        return stream.msg;
    }
    return "zlib status " + std::to_string(status);
}

} // namespace

ZlibDeflater::ZlibDeflater(int level)
{
    if (level < Z_DEFAULT_COMPRESSION || level > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("Invalid zlib compression level: " + std::to_string(level));
    }

    const int status = deflateInit(&stream_, level);
    if (status != Z_OK) {
        throw CodecError::io("Failed to initialise zlib deflate: " + describe(stream_, status));
    }
}

ZlibDeflater::~ZlibDeflater()
{
    deflateEnd(&stream_);
}

std::vector<std::uint8_t> ZlibDeflater::compress(const std::uint8_t* data, std::size_t size)
{
    if (size > std::numeric_limits<uInt>::max()) {
        throw std::invalid_argument("Deflate window exceeds zlib input limit");
    }

    int status = deflateReset(&stream_);
    if (status != Z_OK) {
        throw CodecError::io("Failed to reset zlib deflate: " + describe(stream_, status));
    }

    std::vector<std::uint8_t> compressed(deflateBound(&stream_, static_cast<uLong>(size)));

    stream_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream_.avail_in = static_cast<uInt>(size);
    stream_.next_out = reinterpret_cast<Bytef*>(compressed.data());
    stream_.avail_out = static_cast<uInt>(compressed.size());

    status = deflate(&stream_, Z_FINISH);
    if (status != Z_STREAM_END) {
        throw CodecError::io("zlib deflate did not finish: " + describe(stream_, status));
    }

    compressed.resize(static_cast<std::size_t>(stream_.total_out));
    return compressed;
}

ZlibInflater::ZlibInflater()
{
    const int status = inflateInit(&stream_);
    if (status != Z_OK) {
        throw CodecError::io("Failed to initialise zlib inflate: " + describe(stream_, status));
    }
}

ZlibInflater::~ZlibInflater()
{
    inflateEnd(&stream_);
}

std::uint64_t ZlibInflater::decompress(BoundedReader& source, std::ostream& output)
{
    int status = inflateReset(&stream_);
    if (status != Z_OK) {
        throw CodecError::io("Failed to reset zlib inflate: " + describe(stream_, status));
    }

    std::array<std::uint8_t, kInflateBufferSize> input {};
    std::array<std::uint8_t, kInflateBufferSize> inflated {};
    std::uint64_t produced = 0;
    bool outputFull = false;

    stream_.next_in = input.data();
    stream_.avail_in = 0;

    while (status != Z_STREAM_END) {
        if (stream_.avail_in == 0U && !outputFull) {
            const auto received = source.read(input.data(), input.size());
            if (received == 0U) {
                if (source.truncated()) {
                    throw CodecError::unexpectedEof();
                }
                throw CodecError::io("Compressed chunk ends before its zlib stream is complete");
            }
            stream_.next_in = input.data();
            stream_.avail_in = static_cast<uInt>(received);
        }

        stream_.next_out = inflated.data();
        stream_.avail_out = static_cast<uInt>(inflated.size());

        status = inflate(&stream_, Z_NO_FLUSH);
        switch (status) {
        case Z_OK:
        case Z_STREAM_END:
        case Z_BUF_ERROR:
            break;
        case Z_NEED_DICT:
            throw CodecError::io("Compressed chunk requires a preset dictionary");
        default:
            throw CodecError::io("Corrupt compressed chunk: " + describe(stream_, status));
        }

        const auto produceCount = inflated.size() - stream_.avail_out;
        outputFull = stream_.avail_out == 0U;
        writeBytes(output, inflated.data(), produceCount);
        produced += produceCount;
    }

    return produced;
}

} // namespace dfcompress::codec
