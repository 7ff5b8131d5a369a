#ifndef TUNNY_LORENZ_ERRORS_HPP
#define TUNNY_LORENZ_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace tunny::lorenz {

// malformed or empty seed
struct InvalidSeed : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// non-positive or duplicated period, bad wheel count or position
struct WheelConfigError : std::logic_error {
    using std::logic_error::logic_error;
};

struct SymbolOutOfRange : std::out_of_range {
    std::size_t index = 0;
    unsigned    value = 0;

    SymbolOutOfRange(std::size_t idx, unsigned v)
        : std::out_of_range("symbol " + std::to_string(v) + " at index " + std::to_string(idx)
                            + " is outside [0,31]"),
          index(idx), value(v) {}
};

// raised by the text codec, passed through unchanged by the text operations
struct EncodingError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_ERRORS_HPP
