#pragma once

#include <filesystem>
#include <fstream>

namespace dfcompress::utils {

void ensureParentDirectory(const std::filesystem::path& path);

// Throws std::invalid_argument when `destination` already exists and is the same file as `source`.
void ensureDistinctFiles(const std::filesystem::path& source, const std::filesystem::path& destination);

std::ifstream openInputFile(const std::filesystem::path& path);

// Creates missing parent directories and truncates an existing file.
std::ofstream openOutputFile(const std::filesystem::path& path);

} // namespace dfcompress::utils
