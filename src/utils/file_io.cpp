#include "utils/file_io.hpp"

#include <stdexcept>
#include <system_error>

namespace dfcompress::utils {

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

void ensureDistinctFiles(const std::filesystem::path& source, const std::filesystem::path& destination)
{
    std::error_code ec;
    if (!std::filesystem::exists(destination, ec)) {
        return;
    }

    if (std::filesystem::equivalent(source, destination, ec)) {
        throw std::invalid_argument("Input and output must be different files: " + destination.string());
    }
}

std::ifstream openInputFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        throw std::runtime_error("Input must be a file, not a directory: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    return input;
}

std::ofstream openOutputFile(const std::filesystem::path& path)
{
    ensureParentDirectory(path);

    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    return output;
}

} // namespace dfcompress::utils
