#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace fpg::crypto {

inline constexpr std::string_view kAlphanumericAlphabet =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
inline constexpr std::string_view kDigitAlphabet = "0123456789";

// Fills |out| from the operating system CSPRNG. Throws fpg::Error (Crypto) when
// no entropy source can be read.
void SystemRandomBytes(std::span<uint8_t> out);

// Draws |length| characters uniformly from |alphabet|. Bytes that would bias
// the distribution are rejected and redrawn.
std::string RandomString(std::string_view alphabet, std::size_t length);

inline std::string GeneratePassphrase(std::size_t length) {
  return RandomString(kAlphanumericAlphabet, length);
}

inline std::string RandomDigits(std::size_t count) {
  return RandomString(kDigitAlphabet, count);
}

}  // namespace fpg::crypto
