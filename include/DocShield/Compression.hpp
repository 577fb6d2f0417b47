#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace docshield::compression {

// Raw DEFLATE (no zlib header), as stored in zip members. When consumed is
// non-null it receives the number of compressed bytes read up to the end of
// the stream.
std::string inflateRaw(const char *data, std::size_t length, std::uint64_t maxOutput,
                       std::size_t *consumed = nullptr);

// zlib-wrapped DEFLATE, as used by PDF /FlateDecode streams. Truncated streams
// yield whatever was decoded before the damage.
std::string inflateZlib(const std::string &data, std::uint64_t maxOutput);

std::uint32_t crc32(const std::string &data);

} // namespace docshield::compression
