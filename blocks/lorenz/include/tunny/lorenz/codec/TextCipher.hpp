#ifndef TUNNY_LORENZ_CODEC_TEXTCIPHER_HPP
#define TUNNY_LORENZ_CODEC_TEXTCIPHER_HPP

#include <tunny/lorenz/codec/Ita2.hpp>
#include <tunny/lorenz/core/Cipher.hpp>
#include <tunny/lorenz/core/Symbol.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace tunny::lorenz {

// text -> ITA2 codes -> ciphertext codes; codec failures surface as EncodingError
inline Message encryptText(std::string_view text, std::uint64_t seed, const ita2::Ita2Options& opt = {}) {
    const Message plain = ita2::encode(text, opt);
    return encrypt(plain, seed);
}

inline std::string decryptText(std::span<const Symbol> ciphertext, std::uint64_t seed) {
    return ita2::decode(decrypt(ciphertext, seed));
}

} // namespace tunny::lorenz

#endif // TUNNY_LORENZ_CODEC_TEXTCIPHER_HPP
