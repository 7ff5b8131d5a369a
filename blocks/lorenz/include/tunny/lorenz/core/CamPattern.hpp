#ifndef TUNNY_LORENZ_CAMPATTERN_HPP
#define TUNNY_LORENZ_CAMPATTERN_HPP

#include <tunny/lorenz/core/Errors.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tunny::lorenz {

/*
 * Fixed ring of cams (pins) around one wheel. The length is the wheel's
 * period. A pattern never changes once built; only the wheel's position
 * over it moves.
 */
class CamPattern {
public:
    explicit CamPattern(std::vector<std::uint8_t> pins) : pins_(std::move(pins)) {
        if (pins_.empty()) throw WheelConfigError("CamPattern: period must be > 0");
        for (auto& p : pins_) p = p ? 1u : 0u;
    }

    // all-true or all-false ring, handy for fixtures
    static CamPattern uniform(std::size_t period, bool value) {
        return CamPattern(std::vector<std::uint8_t>(period, value ? 1u : 0u));
    }

    // "x" / "1" marks an active cam, "." / "0" an inactive one
    static CamPattern fromString(const std::string& marks) {
        std::vector<std::uint8_t> pins;
        pins.reserve(marks.size());
        for (char c : marks) {
            switch (c) {
            case 'x': case 'X': case '1': pins.push_back(1u); break;
            case '.': case '0':           pins.push_back(0u); break;
            default:
                throw WheelConfigError(std::string("CamPattern: bad cam mark '") + c + "'");
            }
        }
        return CamPattern(std::move(pins));
    }

    std::size_t period() const noexcept { return pins_.size(); }
    bool pin(std::size_t i) const noexcept { return pins_[i] != 0; }
    std::size_t activeCount() const noexcept {
        return static_cast<std::size_t>(std::count(pins_.begin(), pins_.end(), std::uint8_t{1}));
    }

    std::string toString() const {
        std::string s;
        s.reserve(pins_.size());
        for (auto p : pins_) s.push_back(p ? '1' : '0');
        return s;
    }

    friend bool operator==(const CamPattern&, const CamPattern&) = default;

private:
    std::vector<std::uint8_t> pins_;
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_CAMPATTERN_HPP
