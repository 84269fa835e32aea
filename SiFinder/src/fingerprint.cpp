#include "fingerprint.hpp"

#include <charconv>
#include <format>

namespace sifinder {

std::string Fingerprint::toHex() const
{
    return std::format("{:016x}", m_bits);
}

std::optional<Fingerprint> Fingerprint::fromHex(std::string_view hex)
{
    if (hex.size() != 16) return std::nullopt;

    std::uint64_t value = 0;
    const auto* first = hex.data();
    const auto* last = hex.data() + hex.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || ptr != last) return std::nullopt;

    return Fingerprint(value);
}

} // namespace sifinder
