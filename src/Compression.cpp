#include "DocShield/Compression.hpp"

#include "DocShield/ScanTypes.hpp"

#include <array>
#include <zlib.h>

namespace docshield::compression {

namespace {

constexpr std::size_t kChunk = 16384;

class InflateStream {
  public:
    explicit InflateStream(int windowBits) {
        stream.zalloc = Z_NULL;
        stream.zfree = Z_NULL;
        stream.opaque = Z_NULL;
        if (inflateInit2(&stream, windowBits) != Z_OK) {
            throw MalformedContainer("Unable to initialise inflate stream");
        }
    }
    ~InflateStream() { inflateEnd(&stream); }
    InflateStream(const InflateStream &) = delete;
    InflateStream &operator=(const InflateStream &) = delete;

    z_stream stream{};
};

std::string runInflate(int windowBits, const char *data, std::size_t length, std::uint64_t maxOutput,
                       std::size_t *consumed, bool tolerateTruncation) {
    InflateStream inflater(windowBits);
    auto &stream = inflater.stream;
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data));
    stream.avail_in = static_cast<uInt>(length);

    std::string output;
    std::array<char, kChunk> buffer{};
    int status = Z_OK;
    while (status != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef *>(buffer.data());
        stream.avail_out = static_cast<uInt>(buffer.size());
        status = inflate(&stream, Z_NO_FLUSH);
        const auto produced = buffer.size() - stream.avail_out;
        if (status != Z_OK && status != Z_STREAM_END && status != Z_BUF_ERROR) {
            if (tolerateTruncation && !output.empty()) {
                break;
            }
            throw MalformedContainer(std::string("Corrupt deflate data: ") + (stream.msg ? stream.msg : "unknown"));
        }
        output.append(buffer.data(), produced);
        if (output.size() > maxOutput) {
            throw ResourceLimitExceeded("Inflated data exceeds " + std::to_string(maxOutput) + " bytes");
        }
        if (status == Z_BUF_ERROR || (produced == 0 && stream.avail_in == 0 && status != Z_STREAM_END)) {
            if (tolerateTruncation) {
                break;
            }
            throw MalformedContainer("Truncated deflate data");
        }
    }
    if (consumed != nullptr) {
        *consumed = length - stream.avail_in;
    }
    return output;
}

} // namespace

std::string inflateRaw(const char *data, std::size_t length, std::uint64_t maxOutput, std::size_t *consumed) {
    return runInflate(-MAX_WBITS, data, length, maxOutput, consumed, false);
}

std::string inflateZlib(const std::string &data, std::uint64_t maxOutput) {
    return runInflate(MAX_WBITS, data.data(), data.size(), maxOutput, nullptr, true);
}

std::uint32_t crc32(const std::string &data) {
    uLong crc = ::crc32(0L, Z_NULL, 0);
    crc = ::crc32(crc, reinterpret_cast<const Bytef *>(data.data()), static_cast<uInt>(data.size()));
    return static_cast<std::uint32_t>(crc);
}

} // namespace docshield::compression
