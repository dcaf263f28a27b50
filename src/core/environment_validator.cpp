#include "fpg/core/environment_validator.h"

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>

#include "fpg/errors.h"

namespace fpg::core {

std::string_view Describe(ValidationOutcome outcome) {
  switch (outcome) {
    case ValidationOutcome::kValid:
      return errors::msg::kValidated;
    case ValidationOutcome::kUnsupportedPlatform:
      return errors::msg::kUnsupportedPlatform;
    case ValidationOutcome::kToolUnavailable:
      return errors::msg::kToolUnavailable;
    case ValidationOutcome::kVersionMismatch:
      return errors::msg::kVersionMismatch;
    case ValidationOutcome::kPassphraseTooShort:
      return errors::msg::kPassphraseTooShort;
    case ValidationOutcome::kCipherUnsupported:
      return errors::msg::kCipherUnsupported;
    case ValidationOutcome::kDigestUnsupported:
      return errors::msg::kDigestUnsupported;
    case ValidationOutcome::kExtensionEmpty:
      return errors::msg::kExtensionEmpty;
  }
  return "Unknown validation outcome.";
}

std::string CurrentPlatform() {
  struct utsname info {};
  if (::uname(&info) != 0) {
    return "unknown";
  }
  std::string name(info.sysname);
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return name;
}

ValidationOutcome ValidateEnvironment(std::string_view platform, tools::Encryptor& encryptor,
                                      const orchestrator::BatchConfig& config) {
  if (platform != "linux") {
    return ValidationOutcome::kUnsupportedPlatform;
  }

  auto capabilities = encryptor.QueryCapabilities();
  if (!capabilities) {
    return ValidationOutcome::kToolUnavailable;
  }

  const auto& prefix = config.expected_version_prefix;
  if (capabilities->raw_output.compare(0, prefix.size(), prefix) != 0) {
    return ValidationOutcome::kVersionMismatch;
  }
  if (config.passphrase_length < kMinimumPassphraseLength) {
    return ValidationOutcome::kPassphraseTooShort;
  }
  if (!capabilities->SupportsCipher(config.cipher_id)) {
    return ValidationOutcome::kCipherUnsupported;
  }
  if (!capabilities->SupportsDigest(config.digest_id)) {
    return ValidationOutcome::kDigestUnsupported;
  }
  if (config.output_extension.empty()) {
    return ValidationOutcome::kExtensionEmpty;
  }
  return ValidationOutcome::kValid;
}

}  // namespace fpg::core
