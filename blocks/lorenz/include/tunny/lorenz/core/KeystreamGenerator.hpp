#ifndef TUNNY_LORENZ_KEYSTREAMGENERATOR_HPP
#define TUNNY_LORENZ_KEYSTREAMGENERATOR_HPP

#include <tunny/lorenz/core/SeedExpander.hpp>
#include <tunny/lorenz/core/Symbol.hpp>
#include <tunny/lorenz/core/Wheel.hpp>
#include <tunny/lorenz/core/WheelBank.hpp>

#include <cstdint>
#include <span>
#include <utility>

namespace tunny::lorenz {

namespace detail {
// wheel k supplies bit k, wheel 0 is the LSB
inline Symbol wheelSum(std::span<const Wheel> wheels) noexcept {
    Symbol s = 0;
    for (std::size_t k = 0; k < wheels.size(); ++k)
        s = static_cast<Symbol>(s | (static_cast<unsigned>(wheels[k].pin()) << k));
    return s;
}
} // namespace detail

/*
 * Owns one wheel bank and steps it once per emitted symbol.
 *
 * Each next():
 *   1. out = chi sum ^ psi sum, from the current cams
 *   2. motor 1 steps
 *   3. motor 2 steps if motor 1's cam was set before step 2
 *   4. all chi wheels step
 *   5. all psi wheels step if motor 2's cam (after step 3) is set
 *
 * Step 5 is the limited motion of the psi wheels. Not thread-safe; every
 * step depends on all earlier ones, so there is no skip-ahead.
 */
class KeystreamGenerator {
public:
    explicit KeystreamGenerator(WheelBank bank) : bank_(std::move(bank)) {
        validatePeriods(bank_.periods());
    }

    explicit KeystreamGenerator(std::uint64_t seed) : KeystreamGenerator(generate(seed)) {}

    Symbol next() noexcept {
        const auto out = peek();

        const bool m1 = bank_.motor1().pin();
        bank_.motor1().step();
        if (m1) bank_.motor2().step();

        for (auto& w : bank_.chi()) w.step();

        if (bank_.motor2().pin()) {
            for (auto& w : bank_.psi()) w.step();
            ++psiSteps_;
        }
        ++steps_;
        return out;
    }

    // keystream that would be produced next, without moving any wheel
    Symbol peek() const noexcept {
        return static_cast<Symbol>(detail::wheelSum(bank_.chi()) ^ detail::wheelSum(bank_.psi()));
    }

    const WheelBank& bank() const noexcept { return bank_; }
    KeyState keyState() const noexcept { return bank_.keyState(); }

    std::uint64_t steps() const noexcept { return steps_; }
    std::uint64_t psiSteps() const noexcept { return psiSteps_; }

private:
    WheelBank     bank_;
    std::uint64_t steps_    = 0;
    std::uint64_t psiSteps_ = 0;
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_KEYSTREAMGENERATOR_HPP
