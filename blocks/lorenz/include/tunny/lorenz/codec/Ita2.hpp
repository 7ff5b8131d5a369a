#ifndef TUNNY_LORENZ_CODEC_ITA2_HPP
#define TUNNY_LORENZ_CODEC_ITA2_HPP

#include <tunny/lorenz/core/Errors.hpp>
#include <tunny/lorenz/core/Symbol.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tunny::lorenz::ita2 {

inline constexpr Symbol kFigs = 0x1B;
inline constexpr Symbol kLtrs = 0x1F;

enum class Shift { Letters, Figures };

// '\0' marks a code with no character in that shift (and the shift codes)
inline constexpr std::array<char, 32> kLetters{
    '\0', 'E', '\n', 'A', ' ', 'S', 'I', 'U',
    '\r', 'D', 'R',  'J', 'N', 'F', 'C', 'K',
    'T',  'Z', 'L',  'W', 'H', 'Y', 'P', 'Q',
    'O',  'B', 'G',  '\0', 'M', 'X', 'V', '\0',
};

inline constexpr std::array<char, 32> kFigures{
    '\0', '3', '\n', '-', ' ', '\'', '8', '7',
    '\r', '\x05', '4', '\a', ',', '\0', ':', '(',
    '5',  '+', ')',  '2', '\0', '6', '0', '1',
    '9',  '?', '\0', '\0', '.', '/', '=', '\0',
};

// NUL, LF, SP and CR read the same in both shifts
constexpr bool isShiftless(Symbol code) noexcept {
    return code == 0x00 || code == 0x02 || code == 0x04 || code == 0x08;
}

struct Ita2Options {
    bool replace     = false; // each unmappable character (a whole UTF-8 sequence) becomes '?' instead of throwing
    char replacement = '?';
};

namespace detail {
struct Lookup {
    Symbol code;
    Shift  shift;
    bool   shiftless;
};

inline std::optional<Lookup> find(char c) noexcept {
    if (c == '\0') return Lookup{0x00, Shift::Letters, true};
    for (std::size_t i = 0; i < 32; ++i) {
        const auto code = static_cast<Symbol>(i);
        if (code == kFigs || code == kLtrs) continue;
        if (kLetters[i] == c) return Lookup{code, Shift::Letters, isShiftless(code)};
        if (kFigures[i] == c) return Lookup{code, Shift::Figures, isShiftless(code)};
    }
    return std::nullopt;
}

inline bool isUtf8Lead(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0xC0 && u <= 0xF7;
}

inline bool isUtf8Continuation(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 && u <= 0xBF;
}

inline char upper(char c) noexcept { return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c; }
} // namespace detail

/*
 * Text to ITA2 codes. Both ends start in letters shift; a FIGS or LTRS
 * code is emitted only when the next character needs the other shift.
 * Lower case folds to upper case.
 */
inline Message encode(std::string_view text, const Ita2Options& opt = {}) {
    Message out;
    out.reserve(text.size() + text.size() / 4);
    Shift shift = Shift::Letters;

    for (std::size_t i = 0; i < text.size(); ++i) {
        auto hit = detail::find(detail::upper(text[i]));
        if (!hit && opt.replace) {
            // one replacement per UTF-8 code point, not per byte
            if (detail::isUtf8Lead(text[i]))
                while (i + 1 < text.size() && detail::isUtf8Continuation(text[i + 1])) ++i;
            hit = detail::find(opt.replacement);
        }
        if (!hit) {
            throw EncodingError("ita2: character code " + std::to_string(static_cast<unsigned char>(text[i]))
                                + " at offset " + std::to_string(i) + " has no ITA2 code");
        }
        if (!hit->shiftless && hit->shift != shift) {
            shift = hit->shift;
            out.push_back(shift == Shift::Letters ? kLtrs : kFigs);
        }
        out.push_back(hit->code);
    }
    return out;
}

inline std::string decode(std::span<const Symbol> codes) {
    std::string out;
    out.reserve(codes.size());
    Shift shift = Shift::Letters;

    for (std::size_t i = 0; i < codes.size(); ++i) {
        const auto code = codes[i];
        if (!isValidSymbol(code))
            throw EncodingError("ita2: code " + std::to_string(code) + " at offset " + std::to_string(i)
                                + " is not a 5-bit value");
        if (code == kLtrs) { shift = Shift::Letters; continue; }
        if (code == kFigs) { shift = Shift::Figures; continue; }
        if (code == 0x00) { out.push_back('\0'); continue; }

        const char c = (shift == Shift::Letters ? kLetters : kFigures)[code];
        if (c == '\0')
            throw EncodingError("ita2: code " + std::to_string(code) + " at offset " + std::to_string(i)
                                + " is unassigned in figures shift");
        out.push_back(c);
    }
    return out;
}

} // namespace tunny::lorenz::ita2

#endif // TUNNY_LORENZ_CODEC_ITA2_HPP
