#pragma once

#include <string_view>

namespace fpg::errors::msg {
inline constexpr std::string_view kUnsupportedPlatform{"Tool should be run on Linux."};
inline constexpr std::string_view kToolUnavailable{"GnuPG cannot be called."};
inline constexpr std::string_view kVersionMismatch{"GnuPG version 2.x is required."};
inline constexpr std::string_view kPassphraseTooShort{"Passphrase length should be at least 10 characters."};
inline constexpr std::string_view kCipherUnsupported{"Cipher not supported by GnuPG."};
inline constexpr std::string_view kDigestUnsupported{"Digest not supported by GnuPG."};
inline constexpr std::string_view kExtensionEmpty{"Output extension must not be empty."};
inline constexpr std::string_view kValidated{"Platform and config validated"};
inline constexpr std::string_view kNoSupportedFiles{"No supported files detected."};
inline constexpr std::string_view kSpaceAdvisory{"Are you sure there is enough space?"};
inline constexpr std::string_view kOnlyChance{"This is your only chance to record these!"};
inline constexpr std::string_view kNameRejected{"Name must be non-empty and must not contain '/'."};
inline constexpr std::string_view kNameTaken{"A file with that name already exists."};
}  // namespace fpg::errors::msg
