#include <boost/ut.hpp>
#include <tunny/lorenz/core/CamPattern.hpp>
#include <tunny/lorenz/core/Wheel.hpp>
#include <vector>

using namespace boost::ut;
using namespace tunny::lorenz;

const suite CamPatternSuite = [] {
    "pins and period"_test = [] {
        CamPattern c(std::vector<std::uint8_t>{1, 0, 0, 1, 1});
        expect(c.period() == 5_u);
        expect(c.pin(0) && !c.pin(1) && c.pin(4));
        expect(c.activeCount() == 3_u);
        expect(c.toString() == "10011");
    };

    "non-zero bytes count as active"_test = [] {
        CamPattern c(std::vector<std::uint8_t>{0, 7, 255});
        expect(c.toString() == "011");
    };

    "mark string"_test = [] {
        auto c = CamPattern::fromString("x..x.");
        expect(c == CamPattern(std::vector<std::uint8_t>{1, 0, 0, 1, 0}));
        expect(throws<WheelConfigError>([] { (void)CamPattern::fromString("x-x"); }));
    };

    "empty pattern rejected"_test = [] {
        expect(throws<WheelConfigError>([] { CamPattern c(std::vector<std::uint8_t>{}); }));
        expect(throws<WheelConfigError>([] { (void)CamPattern::uniform(0, true); }));
    };

    "wheel steps modulo its period"_test = [] {
        Wheel w(WheelRole::Chi, 0, CamPattern::fromString("x.x"), 2);
        expect(w.pin());
        w.step();
        expect(w.position() == 0_u);
        w.step();
        expect(w.position() == 1_u);
        expect(!w.pin());
    };

    "wheel start position must lie inside the period"_test = [] {
        expect(throws<WheelConfigError>([] { Wheel w(WheelRole::Psi, 2, CamPattern::uniform(4, false), 4); }));
    };

    "position can only be set inside the period"_test = [] {
        Wheel w(WheelRole::Chi, 0, CamPattern::fromString("x.x.x"), 1);
        w.setPosition(4);
        expect(w.position() == 4_u);
        expect(w.pin());
        expect(throws<WheelConfigError>([&] { w.setPosition(w.period()); }));
        expect(throws<WheelConfigError>([&] { w.setPosition(99); }));
        expect(w.position() == 4_u);
        w.step();
        expect(w.position() == 0_u);
    };

    "wheel names"_test = [] {
        expect(Wheel(WheelRole::Chi, 0, CamPattern::uniform(3, true)).name() == "chi1");
        expect(Wheel(WheelRole::Psi, 4, CamPattern::uniform(3, true)).name() == "psi5");
        expect(Wheel(WheelRole::Motor2, 1, CamPattern::uniform(3, true)).name() == "motor2");
        expect(Wheel(WheelRole::Motor1, 0, CamPattern::fromString("x.."), 1).describe()
               == "wheel name: motor1; current_position: 1; wheel_size: 3; wheel_data: 100");
    };
};

int main() { /* not needed for UT */ }
