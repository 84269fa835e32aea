#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sifinder {

// 64-bit perceptual hash. Bit 63 holds the first DCT coefficient of the
// 8x8 block, bit 0 the last, so the hex form reads in coefficient order.
class Fingerprint {
public:
    static constexpr int kBits = 64;

    Fingerprint() = default;
    explicit constexpr Fingerprint(std::uint64_t bits) : m_bits(bits) {}

    constexpr std::uint64_t bits() const { return m_bits; }

    // 16 lower-case hex digits
    std::string toHex() const;

    // Accepts exactly 16 hex digits, either case
    static std::optional<Fingerprint> fromHex(std::string_view hex);

    friend constexpr bool operator==(const Fingerprint&, const Fingerprint&) = default;

private:
    std::uint64_t m_bits = 0;
};

// Number of differing bit positions
constexpr int hammingDistance(const Fingerprint& a, const Fingerprint& b)
{
    return std::popcount(a.bits() ^ b.bits());
}

} // namespace sifinder
