#include "codec/save_codec.hpp"

#include "codec/bounded_reader.hpp"
#include "codec/error.hpp"
#include "codec/field_io.hpp"
#include "codec/header.hpp"
#include "codec/zlib_stream.hpp"
#include "utils/file_io.hpp"

#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <vector>

namespace dfcompress::codec {
namespace {

ConversionStats beginConversion(std::istream& input, std::ostream& output, Compression target)
{
    ConversionStats stats {};
    stats.input = readHeader(input);
    stats.output.version = stats.input.version;
    stats.output.compression = target;

    writeHeader(output, stats.output);
    stats.bytesWritten = kHeaderSize;
    stats.passthrough = stats.input.compression == target;
    return stats;
}

void passthrough(std::istream& input, std::ostream& output, ConversionStats& stats)
{
    const auto copied = copyStream(input, output);
    stats.bytesWritten += copied;
    if (stats.input.compression == Compression::Raw) {
        stats.bodyBytes = copied;
    }
}

void writeChunks(std::istream& input, std::ostream& output, const CompressOptions& options, ConversionStats& stats)
{
    ZlibDeflater deflater(options.level);
    std::vector<std::uint8_t> window(kChunkWindowSize);

    while (true) {
        BoundedReader reader(input, kChunkWindowSize);
        const auto windowSize = reader.fill(window.data(), window.size());
        if (reader.consumed() == 0U) {
            break;
        }

        const auto compressed = deflater.compress(window.data(), windowSize);
        if (compressed.size() > std::numeric_limits<std::uint32_t>::max()) {
            throw CodecError::io("Compressed chunk exceeds the 32-bit length field");
        }

        writeU32(output, static_cast<std::uint32_t>(compressed.size()));
        writeBytes(output, compressed.data(), compressed.size());

        stats.bodyBytes += windowSize;
        stats.bytesWritten += 4U + compressed.size();
        ++stats.chunkCount;
    }
}

void readChunks(std::istream& input, std::ostream& output, ConversionStats& stats)
{
    ZlibInflater inflater;

    while (const auto length = readU32OrEof(input)) {
        ++stats.chunkCount;
        if (*length == 0U) {
            continue;
        }

        BoundedReader reader(input, *length);
        const auto produced = inflater.decompress(reader, output);
        reader.skipRemaining();
        if (reader.truncated()) {
            throw CodecError::unexpectedEof();
        }

        stats.bodyBytes += produced;
        stats.bytesWritten += produced;
    }
}

void flushOutput(std::ostream& output)
{
    output.flush();
    if (!output) {
        throw CodecError::io("Failed to flush output stream");
    }
}

} // namespace

ConversionStats compressStream(std::istream& input, std::ostream& output, const CompressOptions& options)
{
    auto stats = beginConversion(input, output, Compression::Chunked);

    if (stats.passthrough) {
        passthrough(input, output, stats);
    } else {
        writeChunks(input, output, options, stats);
    }

    flushOutput(output);
    return stats;
}

ConversionStats decompressStream(std::istream& input, std::ostream& output)
{
    auto stats = beginConversion(input, output, Compression::Raw);

    if (stats.passthrough) {
        passthrough(input, output, stats);
    } else {
        readChunks(input, output, stats);
    }

    flushOutput(output);
    return stats;
}

Header inspectStream(std::istream& input)
{
    return readHeader(input);
}

ConversionStats compressFile(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             const CompressOptions& options)
{
    utils::ensureDistinctFiles(source, destination);
    auto input = utils::openInputFile(source);
    auto output = utils::openOutputFile(destination);
    return compressStream(input, output, options);
}

ConversionStats decompressFile(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    utils::ensureDistinctFiles(source, destination);
    auto input = utils::openInputFile(source);
    auto output = utils::openOutputFile(destination);
    return decompressStream(input, output);
}

Header inspectFile(const std::filesystem::path& path)
{
    auto input = utils::openInputFile(path);
    return inspectStream(input);
}

} // namespace dfcompress::codec
