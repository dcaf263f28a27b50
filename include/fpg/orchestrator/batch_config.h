#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

namespace fpg::orchestrator {

// Immutable parameters of one batch run. There are no command line flags for
// these; DefaultBatchConfig() is the compiled-in configuration.
struct BatchConfig {
  std::string cipher_id;
  std::string digest_id;
  std::set<std::string> detected_extensions; // without the leading dot
  std::size_t passphrase_length{0};
  std::uint64_t split_threshold_mb{0};       // ciphertext above this is chunked
  std::string output_extension;              // appended verbatim, e.g. ".enc"
  int compression_level{0};
  std::string random_rename_prefix;
  std::size_t random_rename_digit_count{0};
  std::string expected_version_prefix;       // compared against the first line of `gpg --version`
};

inline BatchConfig DefaultBatchConfig() {
  BatchConfig config;
  config.cipher_id = "AES256";
  config.digest_id = "SHA256";
  config.detected_extensions = {"zip", "7z"};
  config.passphrase_length = 20;
  config.split_threshold_mb = 1000;
  config.output_extension = ".enc";
  config.compression_level = 0; // best throughput for already-compressed archives
  config.random_rename_prefix = "file_";
  config.random_rename_digit_count = 8;
  config.expected_version_prefix = "gpg (GnuPG) 2.";
  return config;
}

}  // namespace fpg::orchestrator
