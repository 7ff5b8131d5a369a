#ifndef TUNNY_LORENZ_WHEELBANK_HPP
#define TUNNY_LORENZ_WHEELBANK_HPP

#include <tunny/lorenz/core/Errors.hpp>
#include <tunny/lorenz/core/Wheel.hpp>

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace tunny::lorenz {

inline constexpr std::size_t kChiCount   = 5;
inline constexpr std::size_t kPsiCount   = 5;
inline constexpr std::size_t kMotorCount = 2;
inline constexpr std::size_t kWheelCount = kChiCount + kPsiCount + kMotorCount;

/*
 * Wheel sizes of the SZ42 as set up at Bletchley Park:
 *   chi 41 31 29 26 23, psi 43 47 51 53 59, motor mu61 then mu37.
 * Motor 1 (mu61) moves every character and drives motor 2 (mu37), which in
 * turn gates the psi wheels.
 */
struct WheelPeriods {
    std::array<int, kChiCount>   chi{};
    std::array<int, kPsiCount>   psi{};
    std::array<int, kMotorCount> motor{};
};

inline constexpr WheelPeriods kHistoricalPeriods{
    /* chi   */ {41, 31, 29, 26, 23},
    /* psi   */ {43, 47, 51, 53, 59},
    /* motor */ {61, 37},
};

namespace detail {
template <std::size_t N>
void checkRolePeriods(const std::array<int, N>& periods, const char* role) {
    for (std::size_t i = 0; i < N; ++i) {
        if (periods[i] <= 0)
            throw WheelConfigError(std::string(role) + " period " + std::to_string(periods[i])
                                   + " is not positive");
        for (std::size_t j = 0; j < i; ++j)
            if (periods[j] == periods[i])
                throw WheelConfigError(std::string(role) + " period " + std::to_string(periods[i])
                                       + " used twice");
    }
}
} // namespace detail

inline void validatePeriods(const WheelPeriods& p) {
    detail::checkRolePeriods(p.chi, "chi");
    detail::checkRolePeriods(p.psi, "psi");
    detail::checkRolePeriods(p.motor, "motor");
}

// positions of chi1..chi5, psi1..psi5, motor1, motor2
struct KeyState {
    std::array<std::size_t, kWheelCount> positions{};
    friend bool operator==(const KeyState&, const KeyState&) = default;
};

class WheelBank {
public:
    static constexpr std::size_t kChiCount   = lorenz::kChiCount;
    static constexpr std::size_t kPsiCount   = lorenz::kPsiCount;
    static constexpr std::size_t kMotorCount = lorenz::kMotorCount;
    static constexpr std::size_t kWheelCount = lorenz::kWheelCount;

    WheelBank(std::vector<Wheel> chi, std::vector<Wheel> psi, std::vector<Wheel> motor)
        : chi_(std::move(chi)), psi_(std::move(psi)), motor_(std::move(motor)) {
        checkRole(chi_, kChiCount, "chi");
        checkRole(psi_, kPsiCount, "psi");
        checkRole(motor_, kMotorCount, "motor");
        for (std::size_t i = 0; i < kChiCount; ++i) expectTag(chi_[i], WheelRole::Chi, i);
        for (std::size_t i = 0; i < kPsiCount; ++i) expectTag(psi_[i], WheelRole::Psi, i);
        expectTag(motor_[0], WheelRole::Motor1, 0);
        expectTag(motor_[1], WheelRole::Motor2, 1);
    }

    std::span<Wheel>       chi() noexcept { return chi_; }
    std::span<const Wheel> chi() const noexcept { return chi_; }
    std::span<Wheel>       psi() noexcept { return psi_; }
    std::span<const Wheel> psi() const noexcept { return psi_; }
    std::span<Wheel>       motor() noexcept { return motor_; }
    std::span<const Wheel> motor() const noexcept { return motor_; }

    Wheel&       motor1() noexcept { return motor_[0]; }
    const Wheel& motor1() const noexcept { return motor_[0]; }
    Wheel&       motor2() noexcept { return motor_[1]; }
    const Wheel& motor2() const noexcept { return motor_[1]; }

    WheelPeriods periods() const noexcept {
        WheelPeriods p;
        for (std::size_t i = 0; i < kChiCount; ++i) p.chi[i] = static_cast<int>(chi_[i].period());
        for (std::size_t i = 0; i < kPsiCount; ++i) p.psi[i] = static_cast<int>(psi_[i].period());
        for (std::size_t i = 0; i < kMotorCount; ++i) p.motor[i] = static_cast<int>(motor_[i].period());
        return p;
    }

    KeyState keyState() const noexcept {
        KeyState ks;
        std::size_t k = 0;
        for (const auto& w : chi_) ks.positions[k++] = w.position();
        for (const auto& w : psi_) ks.positions[k++] = w.position();
        for (const auto& w : motor_) ks.positions[k++] = w.position();
        return ks;
    }

    // all-or-nothing: the bank is untouched when any position is out of range
    void setKeyState(const KeyState& ks) {
        std::size_t k = 0;
        forEach([&](const Wheel& w) {
            if (ks.positions[k] >= w.period())
                throw WheelConfigError(w.name() + ": position " + std::to_string(ks.positions[k])
                                       + " outside period " + std::to_string(w.period()));
            ++k;
        });
        k = 0;
        for (auto& w : chi_) w.setPosition(ks.positions[k++]);
        for (auto& w : psi_) w.setPosition(ks.positions[k++]);
        for (auto& w : motor_) w.setPosition(ks.positions[k++]);
    }

    // one line per wheel, in bank order
    std::string describe() const {
        std::string out;
        forEach([&](const Wheel& w) {
            if (!out.empty()) out.push_back('\n');
            out += w.describe();
        });
        return out;
    }

    template <class F>
    void forEach(F&& f) const {
        for (const auto& w : chi_) f(w);
        for (const auto& w : psi_) f(w);
        for (const auto& w : motor_) f(w);
    }

private:
    std::vector<Wheel> chi_;
    std::vector<Wheel> psi_;
    std::vector<Wheel> motor_;

    static void checkRole(const std::vector<Wheel>& wheels, std::size_t expected, const char* role) {
        if (wheels.size() != expected)
            throw WheelConfigError(std::string(role) + ": expected " + std::to_string(expected)
                                   + " wheels, got " + std::to_string(wheels.size()));
        for (std::size_t i = 0; i < wheels.size(); ++i)
            for (std::size_t j = 0; j < i; ++j)
                if (wheels[i].period() == wheels[j].period())
                    throw WheelConfigError(std::string(role) + " period "
                                           + std::to_string(wheels[i].period()) + " used twice");
    }

    static void expectTag(const Wheel& w, WheelRole role, std::size_t index) {
        if (w.role != role || w.index != index)
            throw WheelConfigError("wheel " + w.name() + " placed in slot " + roleName(role) + " "
                                   + std::to_string(index));
    }
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_WHEELBANK_HPP
