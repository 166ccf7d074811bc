#include "cli/application.hpp"

#include "codec/header.hpp"
#include "codec/save_codec.hpp"
#include "utils/file_io.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace {

using namespace dfcompress;

enum class Command {
    Compress,
    Decompress,
    Inspect,
    Help
};

const std::filesystem::path kStandardStream {"-"};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input {kStandardStream};
    std::filesystem::path output {kStandardStream};
    codec::CompressOptions compress {};
};

void printUsage(std::ostream& out)
{
    out << "Usage:\n"
        << "  dfcompress help\n"
        << "  dfcompress compress   [-i <input>] [-o <output>] [-l <level>]\n"
        << "  dfcompress decompress [-i <input>] [-o <output>]\n"
        << "  dfcompress inspect    -i <input>\n\n"
        << "Options:\n"
        << "  -i, --input <path>    Save file to read, '-' for standard input (default)\n"
        << "  -o, --output <path>   Save file to write, '-' for standard output (default)\n"
        << "  -l, --level <n>       zlib compression level, -1 (default) or 0-9\n\n"
        << "Notes:\n"
        << "  - compress turns a raw save into 20000-byte zlib chunks; decompress reverses it.\n"
        << "  - A save already in the requested form is copied through unchanged.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "compress") {
        return Command::Compress;
    }
    if (lowered == "decompress") {
        return Command::Decompress;
    }
    if (lowered == "inspect") {
        return Command::Inspect;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

int parseLevel(const std::string& value)
{
    int level = 0;
    try {
        std::size_t parsed = 0;
        level = std::stoi(value, &parsed);
        if (parsed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid compression level: " + value);
    }

    if (level < -1 || level > 9) {
        throw std::invalid_argument("Compression level out of range (-1..9): " + value);
    }
    return level;
}

Options parseOptions(const std::vector<std::string>& arguments)
{
    Options options {};

    if (arguments.empty()) {
        return options;
    }

    options.command = parseCommand(arguments.front());
    if (options.command == Command::Help) {
        return options;
    }

    for (std::size_t index = 1; index < arguments.size(); ++index) {
        const auto& argument = arguments[index];
        const bool hasValue = index + 1 < arguments.size();

        if ((argument == "--input" || argument == "-i") && hasValue) {
            options.input = std::filesystem::path(arguments[++index]);
        } else if ((argument == "--output" || argument == "-o") && hasValue) {
            options.output = std::filesystem::path(arguments[++index]);
        } else if ((argument == "--level" || argument == "-l") && hasValue) {
            options.compress.level = parseLevel(arguments[++index]);
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Input path is empty");
    }
    if (options.output.empty()) {
        throw std::invalid_argument("Output path is empty");
    }
    return options;
}

bool isStandardStream(const std::filesystem::path& path)
{
    return path == kStandardStream;
}

codec::ConversionStats runConversion(const Options& options, std::istream& input, std::ostream& output)
{
    if (options.command == Command::Compress) {
        return codec::compressStream(input, output, options.compress);
    }
    return codec::decompressStream(input, output);
}

// A failed conversion leaves no partial save behind.
codec::ConversionStats convertToFile(const Options& options, std::istream& input)
{
    auto output = utils::openOutputFile(options.output);
    try {
        return runConversion(options, input, output);
    } catch (const std::exception&) {
        output.close();
        std::error_code ec;
        std::filesystem::remove(options.output, ec);
        throw;
    }
}

codec::ConversionStats convert(const Options& options, std::istream& in, std::ostream& out)
{
    const bool stdoutOutput = isStandardStream(options.output);

    if (isStandardStream(options.input)) {
        return stdoutOutput ? runConversion(options, in, out) : convertToFile(options, in);
    }

    if (!stdoutOutput) {
        utils::ensureDistinctFiles(options.input, options.output);
    }

    auto input = utils::openInputFile(options.input);
    return stdoutOutput ? runConversion(options, input, out) : convertToFile(options, input);
}

void reportConversion(const Options& options, const codec::ConversionStats& stats, std::ostream& out)
{
    if (isStandardStream(options.output)) {
        return;
    }

    if (options.command == Command::Compress) {
        out << "Compression completed successfully";
    } else {
        out << "Decompression completed successfully";
    }

    if (stats.passthrough) {
        out << " (input already " << codec::toString(stats.input.compression) << ", copied unchanged)\n";
    } else {
        out << " (" << stats.chunkCount << " chunks, " << stats.bodyBytes << " body bytes)\n";
    }
}

void inspect(const Options& options, std::istream& in, std::ostream& out)
{
    codec::Header header {};
    if (isStandardStream(options.input)) {
        header = codec::inspectStream(in);
    } else {
        header = codec::inspectFile(options.input);
    }

    out << "version: " << header.version << "\n"
        << "compression: " << codec::toString(header.compression) << "\n";
}

} // namespace

namespace dfcompress::cli {

int run(int argc, char** argv)
{
    std::vector<std::string> arguments;
    for (int index = 1; index < argc; ++index) {
        arguments.emplace_back(argv[index]);
    }
    return run(arguments, std::cin, std::cout, std::cerr);
}

int run(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out, std::ostream& err)
{
    try {
        const auto options = parseOptions(arguments);

        switch (options.command) {
        case Command::Help:
            printUsage(out);
            return 0;
        case Command::Inspect:
            inspect(options, in, out);
            return 0;
        case Command::Compress:
        case Command::Decompress:
            reportConversion(options, convert(options, in, out), out);
            return 0;
        }

        printUsage(out);
        return 1;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace dfcompress::cli
