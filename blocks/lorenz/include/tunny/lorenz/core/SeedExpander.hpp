#ifndef TUNNY_LORENZ_SEEDEXPANDER_HPP
#define TUNNY_LORENZ_SEEDEXPANDER_HPP

#include <tunny/lorenz/core/CamPattern.hpp>
#include <tunny/lorenz/core/Errors.hpp>
#include <tunny/lorenz/core/Wheel.hpp>
#include <tunny/lorenz/core/WheelBank.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tunny::lorenz {

/*
 * Seed expansion is part of the key format:
 * the same 64-bit seed must give the same wheel bank everywhere.
 *
 *   byte seed  -> FNV-1a 64 -> 64-bit seed
 *   text seed  -> decimal or 0x-hex unsigned 64-bit integer
 *   64-bit seed -> SplitMix64 stream, consumed in bank order
 *                  (chi1..chi5, psi1..psi5, motor1, motor2):
 *                  one draw per cam (top bit), then one draw for the
 *                  start position (draw mod period).
 */
struct SplitMix64 {
    std::uint64_t state = 0;

    constexpr std::uint64_t next() noexcept {
        std::uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    constexpr bool nextBit() noexcept { return (next() >> 63) != 0; }
};

inline constexpr std::uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ULL;
inline constexpr std::uint64_t kFnvPrime       = 0x100000001b3ULL;

inline std::uint64_t foldSeed(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) throw InvalidSeed("seed: byte sequence is empty");
    std::uint64_t h = kFnvOffsetBasis;
    for (auto b : bytes) {
        h ^= b;
        h *= kFnvPrime;
    }
    return h;
}

inline std::uint64_t parseSeed(std::string_view text) {
    if (text.empty()) throw InvalidSeed("seed: empty text");

    unsigned base = 10;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        base = 16;
        text.remove_prefix(2);
    }

    std::uint64_t v = 0;
    for (char c : text) {
        unsigned d = 0;
        if (c >= '0' && c <= '9')                    d = static_cast<unsigned>(c - '0');
        else if (base == 16 && c >= 'a' && c <= 'f') d = static_cast<unsigned>(c - 'a' + 10);
        else if (base == 16 && c >= 'A' && c <= 'F') d = static_cast<unsigned>(c - 'A' + 10);
        else throw InvalidSeed("seed: bad character '" + std::string(1, c) + "'");

        if (v > (UINT64_MAX - d) / base) throw InvalidSeed("seed: value does not fit in 64 bits");
        v = v * base + d;
    }
    return v;
}

namespace detail {
inline Wheel drawWheel(SplitMix64& rng, WheelRole role, unsigned index, int period) {
    const auto n = static_cast<std::size_t>(period);
    std::vector<std::uint8_t> pins(n);
    for (auto& p : pins) p = rng.nextBit() ? 1u : 0u;
    const auto start = static_cast<std::size_t>(rng.next() % n);
    return Wheel(role, index, CamPattern(std::move(pins)), start);
}
} // namespace detail

inline WheelBank generate(std::uint64_t seed, const WheelPeriods& periods = kHistoricalPeriods) {
    validatePeriods(periods);

    SplitMix64 rng{seed};
    std::vector<Wheel> chi, psi, motor;
    chi.reserve(WheelBank::kChiCount);
    psi.reserve(WheelBank::kPsiCount);
    motor.reserve(WheelBank::kMotorCount);

    for (unsigned i = 0; i < WheelBank::kChiCount; ++i)
        chi.push_back(detail::drawWheel(rng, WheelRole::Chi, i, periods.chi[i]));
    for (unsigned i = 0; i < WheelBank::kPsiCount; ++i)
        psi.push_back(detail::drawWheel(rng, WheelRole::Psi, i, periods.psi[i]));
    motor.push_back(detail::drawWheel(rng, WheelRole::Motor1, 0, periods.motor[0]));
    motor.push_back(detail::drawWheel(rng, WheelRole::Motor2, 1, periods.motor[1]));

    return WheelBank(std::move(chi), std::move(psi), std::move(motor));
}

inline WheelBank generate(std::span<const std::uint8_t> seed, const WheelPeriods& periods = kHistoricalPeriods) {
    return generate(foldSeed(seed), periods);
}

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_SEEDEXPANDER_HPP
