#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "fpg/orchestrator/batch_config.h"
#include "fpg/tools/encryptor.h"

namespace fpg::core {

// Ordered by check priority; the first failing check is reported.
enum class ValidationOutcome {
  kValid = 0,
  kUnsupportedPlatform,
  kToolUnavailable,
  kVersionMismatch,
  kPassphraseTooShort,
  kCipherUnsupported,
  kDigestUnsupported,
  kExtensionEmpty,
};

inline constexpr std::size_t kMinimumPassphraseLength = 10;

std::string_view Describe(ValidationOutcome outcome);

// Lower-case kernel name of the running host ("linux", "darwin", ...).
std::string CurrentPlatform();

// Checks the host and the encryption tool against |config| before any file is
// touched. The tool is not queried on an unsupported platform.
ValidationOutcome ValidateEnvironment(std::string_view platform, tools::Encryptor& encryptor,
                                      const orchestrator::BatchConfig& config);

}  // namespace fpg::core
