#include "DocShield/Crypto.hpp"

#include <iomanip>
#include <sstream>

namespace docshield::crypto {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

std::uint32_t rotateRight(std::uint32_t value, unsigned bits) {
    return (value >> bits) | (value << (32u - bits));
}

std::uint32_t loadBigEndian(const std::uint8_t *bytes) {
    return (static_cast<std::uint32_t>(bytes[0]) << 24) | (static_cast<std::uint32_t>(bytes[1]) << 16) |
           (static_cast<std::uint32_t>(bytes[2]) << 8) | static_cast<std::uint32_t>(bytes[3]);
}

} // namespace

Sha256::Sha256()
    : state{0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au, 0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u} {}

void Sha256::update(const std::string &data) {
    update(reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
}

void Sha256::update(const std::uint8_t *data, std::size_t length) {
    for (std::size_t i = 0; i < length; ++i) {
        block[blockLength++] = data[i];
        if (blockLength == block.size()) {
            compress();
            totalBits += 512;
            blockLength = 0;
        }
    }
}

std::array<std::uint8_t, 32> Sha256::finish() {
    totalBits += static_cast<std::uint64_t>(blockLength) * 8u;

    block[blockLength++] = 0x80;
    if (blockLength > 56) {
        while (blockLength < block.size()) {
            block[blockLength++] = 0x00;
        }
        compress();
        blockLength = 0;
    }
    while (blockLength < 56) {
        block[blockLength++] = 0x00;
    }
    for (int shift = 56; shift >= 0; shift -= 8) {
        block[blockLength++] = static_cast<std::uint8_t>(totalBits >> shift);
    }
    compress();
    blockLength = 0;

    std::array<std::uint8_t, 32> digest{};
    for (std::size_t word = 0; word < state.size(); ++word) {
        digest[word * 4] = static_cast<std::uint8_t>(state[word] >> 24);
        digest[word * 4 + 1] = static_cast<std::uint8_t>(state[word] >> 16);
        digest[word * 4 + 2] = static_cast<std::uint8_t>(state[word] >> 8);
        digest[word * 4 + 3] = static_cast<std::uint8_t>(state[word]);
    }
    return digest;
}

void Sha256::compress() {
    std::array<std::uint32_t, 64> schedule{};
    for (std::size_t i = 0; i < 16; ++i) {
        schedule[i] = loadBigEndian(block.data() + i * 4);
    }
    for (std::size_t i = 16; i < schedule.size(); ++i) {
        const auto s0 = rotateRight(schedule[i - 15], 7) ^ rotateRight(schedule[i - 15], 18) ^ (schedule[i - 15] >> 3);
        const auto s1 = rotateRight(schedule[i - 2], 17) ^ rotateRight(schedule[i - 2], 19) ^ (schedule[i - 2] >> 10);
        schedule[i] = schedule[i - 16] + s0 + schedule[i - 7] + s1;
    }

    auto working = state;
    for (std::size_t i = 0; i < schedule.size(); ++i) {
        auto &[a, b, c, d, e, f, g, h] = working;
        const auto sigma1 = rotateRight(e, 6) ^ rotateRight(e, 11) ^ rotateRight(e, 25);
        const auto choose = (e & f) ^ ((~e) & g);
        const auto t1 = h + sigma1 + choose + kRoundConstants[i] + schedule[i];
        const auto sigma0 = rotateRight(a, 2) ^ rotateRight(a, 13) ^ rotateRight(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto t2 = sigma0 + majority;
        h = g;
        g = f;
        f = e;
        e = d + t1;
        d = c;
        c = b;
        b = a;
        a = t1 + t2;
    }

    for (std::size_t i = 0; i < state.size(); ++i) {
        state[i] += working[i];
    }
}

std::string toHex(const std::uint8_t *data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string sha256(const std::string &data) {
    Sha256 hasher;
    hasher.update(data);
    const auto digest = hasher.finish();
    return toHex(digest.data(), digest.size());
}

} // namespace docshield::crypto
