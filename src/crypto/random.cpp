#include "fpg/crypto/random.h"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <span>

#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#include <unistd.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "fpg/error.h"
#include "fpg/security/zeroizer.h"

namespace {

constexpr std::size_t kRandomBatchSize = 64;

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw fpg::Error(fpg::ErrorDomain::Crypto, fpg::errors::crypto::kRandomUnavailable,
                     "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw fpg::Error(fpg::ErrorDomain::Crypto, fpg::errors::crypto::kRandomUnavailable,
                     "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace fpg::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  bool used_blocking = false;
  while (offset < out.size()) {
    const int flags = used_blocking ? 0 : GRND_NONBLOCK;
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, flags);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN && !used_blocking) {
        break; // fall back to /dev/urandom below
      }
      throw Error(ErrorDomain::Crypto, errors::crypto::kRandomUnavailable, "getrandom failed",
                  errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
    used_blocking = true;
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

std::string RandomString(std::string_view alphabet, std::size_t length) {
  if (alphabet.empty() || alphabet.size() > 256) {
    throw Error(ErrorDomain::Validation, errors::validation::kEmptyAlphabet,
                "Random alphabet must contain between 1 and 256 symbols");
  }
  // Largest multiple of the alphabet size that fits in a byte; anything at or
  // above it is discarded so every symbol keeps the same probability.
  const std::size_t limit = 256 - (256 % alphabet.size());

  std::string result;
  result.reserve(length);
  std::array<uint8_t, kRandomBatchSize> pool{};
  security::Zeroizer::ScopeWiper<uint8_t> pool_guard{std::span<uint8_t>(pool)};
  while (result.size() < length) {
    SystemRandomBytes(pool);
    for (uint8_t byte : pool) {
      if (byte >= limit) {
        continue;
      }
      result.push_back(alphabet[byte % alphabet.size()]);
      if (result.size() == length) {
        break;
      }
    }
  }
  return result;
}

}  // namespace fpg::crypto
