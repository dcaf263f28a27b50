#include "fpg/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <string>

#include "fpg/error.h"

namespace fpg::crypto {

namespace {

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

}  // namespace

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  std::array<uint8_t, 32> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1 ||
      digest_len != digest.size()) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kDigestFailed,
                BuildOpenSSLErrorMessage("SHA-256 digest failed"));
  }
  return digest;
}

std::array<uint8_t, 32> SHA256_Hash(std::string_view text) {
  const auto* data = reinterpret_cast<const uint8_t*>(text.data());
  return SHA256_Hash(std::span<const uint8_t>(data, text.size()));
}

std::string SHA256_Hex(std::string_view text) {
  auto digest = SHA256_Hash(text);
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

}  // namespace fpg::crypto
