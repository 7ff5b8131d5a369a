#ifndef TUNNY_LORENZ_MEASURE_BITSTATISTICS_HPP
#define TUNNY_LORENZ_MEASURE_BITSTATISTICS_HPP

#include <tunny/lorenz/core/Symbol.hpp>

#include <bit>
#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>

namespace tunny::lorenz {

// "0b" then 5 binary digits per symbol, MSB first
inline std::string toBinaryString(std::span<const Symbol> msg) {
    std::string s = "0b";
    s.reserve(2 + msg.size() * kSymbolBits);
    for (auto v : msg)
        for (int b = static_cast<int>(kSymbolBits) - 1; b >= 0; --b) s.push_back(((v >> b) & 1u) ? '1' : '0');
    return s;
}

inline std::size_t hammingDistance(std::span<const Symbol> a, std::span<const Symbol> b) {
    if (a.size() != b.size()) throw std::invalid_argument("hammingDistance: length mismatch");
    std::size_t d = 0;
    for (std::size_t i = 0; i < a.size(); ++i)
        d += static_cast<std::size_t>(std::popcount(static_cast<unsigned>((a[i] ^ b[i]) & kSymbolMask)));
    return d;
}

// share of bit positions (0..100) that are equal in a and b
inline double bitAgreement(std::span<const Symbol> a, std::span<const Symbol> b) {
    const auto d = hammingDistance(a, b);
    if (a.empty()) return 0.0;
    const double total = static_cast<double>(a.size() * kSymbolBits);
    return 100.0 * (total - static_cast<double>(d)) / total;
}

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_MEASURE_BITSTATISTICS_HPP
