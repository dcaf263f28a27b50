#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace fpg {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Dependency = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // errno values and tool exit statuses.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Dependency:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kStatFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kFreeSpaceQueryFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kRenameFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kRemoveFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kDirectoryListFailed = Make(ErrorDomain::IO, 0x05);
      inline constexpr int kPipeFailed = Make(ErrorDomain::IO, 0x06);
    } // namespace io

    namespace dependency {
      inline constexpr int kSpawnFailed = Make(ErrorDomain::Dependency, 0x01);
      inline constexpr int kSplitFailed = Make(ErrorDomain::Dependency, 0x02);
    } // namespace dependency

    namespace crypto {
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x02);
    } // namespace crypto

    namespace validation {
      inline constexpr int kInvalidName = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kEmptyAlphabet = Make(ErrorDomain::Validation, 0x02);
    } // namespace validation

    namespace state {
      inline constexpr int kUnitNotEncrypted = Make(ErrorDomain::State, 0x01);
    } // namespace state

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt)
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native) {}
  };
} // namespace fpg
