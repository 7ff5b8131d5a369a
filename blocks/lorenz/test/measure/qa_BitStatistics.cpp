#include <boost/ut.hpp>
#include <tunny/lorenz/codec/Ita2.hpp>
#include <tunny/lorenz/core/Cipher.hpp>
#include <tunny/lorenz/measure/BitStatistics.hpp>

#include <stdexcept>
#include <string>

using namespace boost::ut;
using namespace tunny::lorenz;

const suite BitStatisticsSuite = [] {
    "binary rendering"_test = [] {
        expect(toBinaryString(Message{}) == "0b");
        expect(toBinaryString(Message{0x14, 0x01, 0x1F}) == "0b101000000111111");
    };

    "hamming distance"_test = [] {
        expect(hammingDistance(Message{0, 31}, Message{0, 31}) == 0_u);
        expect(hammingDistance(Message{0, 31}, Message{31, 0}) == 10_u);
        expect(hammingDistance(Message{0x01}, Message{0x03}) == 1_u);
        expect(throws<std::invalid_argument>([] { (void)hammingDistance(Message{1}, Message{}); }));
    };

    "agreement percentage"_test = [] {
        expect(bitAgreement(Message{}, Message{}) == 0.0_d);
        expect(bitAgreement(Message{5, 9}, Message{5, 9}) == 100.0_d);
        expect(bitAgreement(Message{0, 0}, Message{31, 0}) == 50.0_d);
    };

    "ciphertext agrees with plaintext about half the time"_test = [] {
        std::string text;
        for (int i = 0; i < 60; ++i) text += "THE WAR TO END ALL WARS. ";
        const auto plain  = ita2::encode(text);
        const auto cipher = encrypt(plain, 42);
        const double pct = bitAgreement(plain, cipher);
        expect(pct > 40.0 && pct < 60.0) << "agreement " << pct << "%";
    };
};

int main() { /* not needed for UT */ }
