#ifndef TUNNY_LORENZ_WHEEL_HPP
#define TUNNY_LORENZ_WHEEL_HPP

#include <tunny/lorenz/core/CamPattern.hpp>
#include <tunny/lorenz/core/Errors.hpp>

#include <cstddef>
#include <string>
#include <utility>

namespace tunny::lorenz {

enum class WheelRole { Chi, Psi, Motor1, Motor2 };

inline const char* roleName(WheelRole r) noexcept {
    switch (r) {
    case WheelRole::Chi:    return "chi";
    case WheelRole::Psi:    return "psi";
    case WheelRole::Motor1: return "motor1";
    case WheelRole::Motor2: return "motor2";
    }
    return "?";
}

// cams are fixed and position only moves through step() and setPosition(),
// so pin() always reads inside the ring
class Wheel {
public:
    WheelRole role{WheelRole::Chi};
    unsigned  index{0}; // 0-based within the role

    Wheel(WheelRole r, unsigned idx, CamPattern pattern, std::size_t start = 0)
        : role(r), index(idx), cams_(std::move(pattern)) {
        setPosition(start);
    }

    const CamPattern& cams() const noexcept { return cams_; }
    std::size_t period() const noexcept { return cams_.period(); }
    std::size_t position() const noexcept { return position_; }
    bool pin() const noexcept { return cams_.pin(position_); }

    void setPosition(std::size_t p) {
        if (p >= cams_.period())
            throw WheelConfigError(name() + ": position " + std::to_string(p) + " outside period "
                                   + std::to_string(cams_.period()));
        position_ = p;
    }

    void step() noexcept {
        if (++position_ == cams_.period()) position_ = 0;
    }

    std::string name() const {
        if (role == WheelRole::Motor1 || role == WheelRole::Motor2) return roleName(role);
        return std::string(roleName(role)) + std::to_string(index + 1);
    }

    std::string describe() const {
        return "wheel name: " + name() + "; current_position: " + std::to_string(position_)
               + "; wheel_size: " + std::to_string(period()) + "; wheel_data: " + cams_.toString();
    }

private:
    CamPattern  cams_;
    std::size_t position_{0};
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_WHEEL_HPP
