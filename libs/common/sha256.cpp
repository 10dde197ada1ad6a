/**
 * @file sha256.cpp
 * @brief SHA-256 implementation (standalone, no external dependency)
 *
 * Used for validation cache keys; the digest is streamed block by block so
 * large code submissions are never copied.
 */

#include "secbox/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <format>
#include <ranges>
#include <span>

namespace secbox::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    {0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
     0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
     0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
     0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
     0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
     0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
     0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
     0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
     0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
     0xc67178f2}
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab,
     0x5be0cd19}
};

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const std::uint8_t* bytes) noexcept
{
    std::uint32_t value{};
    std::memcpy(&value, bytes, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    } else {
        return value;
    }
}

class Sha256Digest
{
public:
    void update(std::string_view data)
    {
        auto bytes = std::span(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
        m_total_bytes += bytes.size();

        if (m_pending > 0) {
            const auto take = std::min(bytes.size(), m_block.size() - m_pending);
            std::memcpy(m_block.data() + m_pending, bytes.data(), take);
            m_pending += take;
            bytes = bytes.subspan(take);
            if (m_pending < m_block.size()) {
                return;
            }
            compress(m_block.data());
            m_pending = 0;
        }
        while (bytes.size() >= m_block.size()) {
            compress(bytes.data());
            bytes = bytes.subspan(m_block.size());
        }
        std::memcpy(m_block.data(), bytes.data(), bytes.size());
        m_pending = bytes.size();
    }

    [[nodiscard]] std::string hex_digest()
    {
        const std::uint64_t total_bits = static_cast<std::uint64_t>(m_total_bytes) * 8U;

        m_block[m_pending++] = 0x80;
        if (m_pending > 56) {
            std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_pending), m_block.end(), 0);
            compress(m_block.data());
            m_pending = 0;
        }
        std::fill(m_block.begin() + static_cast<std::ptrdiff_t>(m_pending),
                  m_block.begin() + 56,
                  0);
        for (auto i : std::views::iota(0, 8)) {
            const auto shift = static_cast<std::uint64_t>(7 - i) * 8U;
            m_block[56 + static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>(total_bits >> shift);
        }
        compress(m_block.data());

        std::string out;
        out.reserve(64);
        for (auto word : m_state) {
            out += std::format("{:08x}", word);
        }
        return out;
    }

private:
    void compress(const std::uint8_t* block)
    {
        std::array<std::uint32_t, 64> schedule{};
        for (auto i : std::views::iota(0uz, 16uz)) {
            schedule[i] = load_be32(block + (i * 4));
        }
        for (auto i : std::views::iota(16uz, 64uz)) {
            schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                          + small_sigma0(schedule[i - 15]) + schedule[i - 16];
        }

        auto work = m_state;
        for (auto [i, w] : std::views::enumerate(schedule)) {
            auto& [a, b, c, d, e, f, g, h] = work;
            const std::uint32_t t1 = h + big_sigma1(e) + ((e & f) ^ (~e & g))
                                     + kRoundConstants[static_cast<std::size_t>(i)] + w;
            const std::uint32_t t2 = big_sigma0(a) + ((a & b) ^ (a & c) ^ (b & c));
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }
        for (auto [state, value] : std::views::zip(m_state, work)) {
            state += value;
        }
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, 64> m_block{};
    std::size_t m_pending = 0;
    std::size_t m_total_bytes = 0;
};

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256Digest digest;
    digest.update(data);
    return digest.hex_digest();
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace secbox::common
