#include <boost/ut.hpp>
#include <tunny/lorenz/core/SeedExpander.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace tunny::lorenz;

const suite SeedExpanderSuite = [] {
    "SplitMix64 reference outputs"_test = [] {
        SplitMix64 rng{0};
        expect(rng.next() == 0xe220a8397b1dcdafULL);
        expect(rng.next() == 0x6e789e6aa1b965f4ULL);
    };

    "same seed, same bank"_test = [] {
        const auto a = generate(42);
        const auto b = generate(42);
        expect(a.keyState() == b.keyState());
        for (std::size_t i = 0; i < WheelBank::kChiCount; ++i) expect(a.chi()[i].cams() == b.chi()[i].cams());
        for (std::size_t i = 0; i < WheelBank::kPsiCount; ++i) expect(a.psi()[i].cams() == b.psi()[i].cams());
        for (std::size_t i = 0; i < WheelBank::kMotorCount; ++i) expect(a.motor()[i].cams() == b.motor()[i].cams());
        expect(a.describe() == b.describe());
    };

    "seed 42 expansion is pinned"_test = [] {
        const auto bank = generate(42);
        const KeyState expected{{6, 4, 23, 19, 16, 17, 20, 14, 3, 39, 9, 25}};
        expect(bank.keyState() == expected);
        expect(bank.chi()[0].cams().toString() == "10000101010011100001101100111111111000101");
        expect(bank.motor2().cams().activeCount() == 16_u);
    };

    "historical periods"_test = [] {
        const auto p = generate(7).periods();
        expect(p.chi == kHistoricalPeriods.chi);
        expect(p.psi == kHistoricalPeriods.psi);
        expect(p.motor == kHistoricalPeriods.motor);
        expect(eq(p.motor[0], 61));
        expect(eq(p.motor[1], 37));
    };

    "different seeds give different banks"_test = [] {
        expect(generate(1).describe() != generate(2).describe());
    };

    "byte seeds fold with FNV-1a"_test = [] {
        const std::vector<std::uint8_t> bytes{'t', 'u', 'n', 'n', 'y'};
        expect(foldSeed(bytes) == 0x5e0afbd0aa0452a5ULL);
        expect(generate(bytes).keyState() == generate(0x5e0afbd0aa0452a5ULL).keyState());
        expect(eq(generate(bytes).chi()[0].position(), std::size_t{29}));
        expect(throws<InvalidSeed>([] { (void)foldSeed(std::vector<std::uint8_t>{}); }));
    };

    "text seeds"_test = [] {
        expect(eq(parseSeed("42"), std::uint64_t{42}));
        expect(eq(parseSeed("0x2a"), std::uint64_t{42}));
        expect(eq(parseSeed("0X2A"), std::uint64_t{42}));
        expect(parseSeed("18446744073709551615") == 18446744073709551615ULL);
        expect(throws<InvalidSeed>([] { (void)parseSeed(""); }));
        expect(throws<InvalidSeed>([] { (void)parseSeed("12a"); }));
        expect(throws<InvalidSeed>([] { (void)parseSeed("0x"); }));
        expect(throws<InvalidSeed>([] { (void)parseSeed("-1"); }));
        expect(throws<InvalidSeed>([] { (void)parseSeed("18446744073709551616"); }));
    };

    "bad periods rejected"_test = [] {
        WheelPeriods dup = kHistoricalPeriods;
        dup.psi[3] = dup.psi[0];
        expect(throws<WheelConfigError>([&] { (void)generate(1, dup); }));

        WheelPeriods zero = kHistoricalPeriods;
        zero.chi[2] = 0;
        expect(throws<WheelConfigError>([&] { (void)generate(1, zero); }));

        WheelPeriods negative = kHistoricalPeriods;
        negative.motor[1] = -37;
        expect(throws<WheelConfigError>([&] { (void)generate(1, negative); }));
    };

    "same period across roles is allowed"_test = [] {
        WheelPeriods p = kHistoricalPeriods;
        p.psi[0] = 41; // chi1 is also 41
        expect(nothrow([&] { (void)generate(1, p); }));
    };
};

int main() { /* not needed for UT */ }
