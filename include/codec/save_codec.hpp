#pragma once

#include "codec/types.hpp"

#include <filesystem>
#include <iosfwd>

namespace dfcompress::codec {

// Raw save (tag 0) -> chunked save (tag 1). A chunked input is copied through unchanged.
ConversionStats compressStream(std::istream& input, std::ostream& output, const CompressOptions& options = {});

// Chunked save (tag 1) -> raw save (tag 0). A raw input is copied through unchanged.
ConversionStats decompressStream(std::istream& input, std::ostream& output);

// Validates and returns the header without touching the body.
Header inspectStream(std::istream& input);

ConversionStats compressFile(const std::filesystem::path& source,
                             const std::filesystem::path& destination,
                             const CompressOptions& options = {});
ConversionStats decompressFile(const std::filesystem::path& source, const std::filesystem::path& destination);
Header inspectFile(const std::filesystem::path& path);

} // namespace dfcompress::codec
