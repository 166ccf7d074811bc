#pragma once

#include "codec/types.hpp"

#include <iosfwd>

namespace dfcompress::codec {

Header readHeader(std::istream& input);
void writeHeader(std::ostream& output, const Header& header);

const char* toString(Compression compression) noexcept;

} // namespace dfcompress::codec
