#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace docshield::crypto {

class Sha256 {
  public:
    Sha256();

    void update(const std::string &data);
    void update(const std::uint8_t *data, std::size_t length);
    std::array<std::uint8_t, 32> finish();

  private:
    void compress();

    std::array<std::uint32_t, 8> state{};
    std::array<std::uint8_t, 64> block{};
    std::size_t blockLength{0};
    std::uint64_t totalBits{0};
};

std::string sha256(const std::string &data);
std::string toHex(const std::uint8_t *data, std::size_t length);

} // namespace docshield::crypto
