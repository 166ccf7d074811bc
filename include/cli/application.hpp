#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace dfcompress::cli {

int run(int argc, char** argv);

// `arguments` excludes the program name. `in`/`out` stand in for "-" paths;
// status lines go to `out` only when the conversion output is a file.
int run(const std::vector<std::string>& arguments, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace dfcompress::cli
