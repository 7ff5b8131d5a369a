#ifndef TUNNY_LORENZ_SYMBOL_HPP
#define TUNNY_LORENZ_SYMBOL_HPP

#include <cstdint>
#include <vector>

namespace tunny::lorenz {

// one 5-bit teleprinter code unit; wider storage so bad input stays detectable
using Symbol  = std::uint8_t;
using Message = std::vector<Symbol>;

inline constexpr unsigned kSymbolBits = 5;
inline constexpr Symbol   kSymbolMask = 0x1F;

constexpr bool isValidSymbol(unsigned v) noexcept { return v <= kSymbolMask; }

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_SYMBOL_HPP
