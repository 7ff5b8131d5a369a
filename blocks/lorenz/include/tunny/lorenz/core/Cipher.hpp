#ifndef TUNNY_LORENZ_CIPHER_HPP
#define TUNNY_LORENZ_CIPHER_HPP

#include <tunny/lorenz/core/Errors.hpp>
#include <tunny/lorenz/core/KeystreamGenerator.hpp>
#include <tunny/lorenz/core/SeedExpander.hpp>
#include <tunny/lorenz/core/Symbol.hpp>
#include <tunny/lorenz/core/WheelBank.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

namespace tunny::lorenz {

// throws SymbolOutOfRange for the first symbol above 31
inline void validateMessage(std::span<const Symbol> message) {
    for (std::size_t i = 0; i < message.size(); ++i)
        if (!isValidSymbol(message[i])) throw SymbolOutOfRange(i, message[i]);
}

// result[i] = message[i] ^ gen.next(); the same call enciphers and deciphers
inline Message transform(std::span<const Symbol> message, KeystreamGenerator& gen) {
    validateMessage(message);

    Message out;
    out.reserve(message.size());
    for (auto s : message) out.push_back(static_cast<Symbol>(s ^ gen.next()));
    return out;
}

inline Message encrypt(std::span<const Symbol> plaintext, std::uint64_t seed) {
    KeystreamGenerator gen(generate(seed));
    return transform(plaintext, gen);
}

inline Message decrypt(std::span<const Symbol> ciphertext, std::uint64_t seed) {
    KeystreamGenerator gen(generate(seed));
    return transform(ciphertext, gen);
}

inline Message encrypt(std::span<const Symbol> plaintext, std::span<const std::uint8_t> seed) {
    return encrypt(plaintext, foldSeed(seed));
}

inline Message decrypt(std::span<const Symbol> ciphertext, std::span<const std::uint8_t> seed) {
    return decrypt(ciphertext, foldSeed(seed));
}

// -----------------------------------------------------------------------------
// Streaming form: one symbol in, one symbol out, machine state kept between
// calls. start() rebuilds the wheels from the seed, optionally at a given
// key state (e.g. to resume a transmission part way through).
// -----------------------------------------------------------------------------
struct LorenzCipherState {
    std::uint64_t           seed    = 0;
    WheelPeriods            periods = kHistoricalPeriods;
    std::optional<KeyState> start_state{};
};

struct LorenzCipher {
    LorenzCipherState                 st{};
    std::optional<KeystreamGenerator> gen{};
    std::size_t                       processed = 0;

    void start() {
        WheelBank bank = generate(st.seed, st.periods);
        if (st.start_state) bank.setKeyState(*st.start_state);
        gen.emplace(std::move(bank));
        processed = 0;
    }

    void stop() { gen.reset(); }

    Symbol processOne(Symbol in) {
        if (!gen) throw std::logic_error("LorenzCipher: processOne before start");
        if (!isValidSymbol(in)) throw SymbolOutOfRange(processed, in);
        ++processed;
        return static_cast<Symbol>(in ^ gen->next());
    }

    // nothing is written when any input symbol is out of range
    void process(const Symbol* in, Symbol* out, std::size_t n) {
        if (!gen) throw std::logic_error("LorenzCipher: process before start");
        for (std::size_t i = 0; i < n; ++i)
            if (!isValidSymbol(in[i])) throw SymbolOutOfRange(processed + i, in[i]);
        for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<Symbol>(in[i] ^ gen->next());
        processed += n;
    }

    KeyState keyState() const {
        if (!gen) throw std::logic_error("LorenzCipher: not started");
        return gen->keyState();
    }
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_CIPHER_HPP
