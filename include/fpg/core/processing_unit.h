#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "fpg/orchestrator/batch_config.h"
#include "fpg/platform/file_ops.h"
#include "fpg/tools/encryptor.h"
#include "fpg/tools/splitter.h"

namespace fpg::core {

enum class UnitState { kPending, kEncrypted };

enum class UnitStatus {
  kOk = 0,
  kInvalidState, // operation requires an encrypted unit
  kToolFailure,  // the encryption tool exited non-zero
};

std::string_view ToString(UnitStatus status);

enum class SplitOutcome { kNotSplit, kSplit };

struct SplitReport {
  SplitOutcome outcome{SplitOutcome::kNotSplit};
  std::size_t pieces{1}; // 1 whole file when not split
};

// One discovered file and its progress through the batch. The on-disk
// ciphertext is always |name| + output extension.
class ProcessingUnit {
public:
  ProcessingUnit(std::filesystem::path directory, std::string name, std::string extension,
                 std::uint64_t size_bytes);
  ~ProcessingUnit();

  ProcessingUnit(ProcessingUnit&& other) noexcept;
  ProcessingUnit& operator=(ProcessingUnit&& other) noexcept;
  ProcessingUnit(const ProcessingUnit&) = delete;
  ProcessingUnit& operator=(const ProcessingUnit&) = delete;

  // Generates a fresh passphrase and encrypts the file into name + extension.
  // The cleartext file is left untouched. On kToolFailure the unit stays
  // pending and the tool's diagnostic is kept in LastDiagnostic(). A unit is
  // encrypted at most once; a second call returns kInvalidState.
  UnitStatus Encrypt(tools::Encryptor& encryptor, const orchestrator::BatchConfig& config);

  // Chunks the ciphertext when the pre-encryption size exceeds the split
  // threshold, then removes the combined ciphertext. Splitter or removal
  // failures throw fpg::Error.
  UnitStatus SplitIfShouldSplit(tools::Splitter& splitter, platform::FileOps& file_ops,
                                const orchestrator::BatchConfig& config, SplitReport& report);

  // Moves the ciphertext to new_name + extension. Must run before splitting.
  void Rename(std::string new_name, platform::FileOps& file_ops,
              const orchestrator::BatchConfig& config);

  UnitStatus GetPassphrase(std::string& out) const;

  const std::string& Name() const noexcept { return name_; }
  const std::string& Extension() const noexcept { return extension_; }
  double SizeMB() const noexcept { return size_mb_; }
  double RoundedSizeMB() const noexcept;
  UnitState State() const noexcept { return state_; }
  bool IsEncrypted() const noexcept { return state_ == UnitState::kEncrypted; }
  const std::string& LastDiagnostic() const noexcept { return last_diagnostic_; }

  // Rounded MB/s for an encryption that took |seconds|; 0 when no time elapsed.
  double EncryptionSpeed(double seconds) const noexcept;

  std::string EncryptedFileName(const orchestrator::BatchConfig& config) const {
    return name_ + config.output_extension;
  }
  std::filesystem::path EncryptedPath(const orchestrator::BatchConfig& config) const;

private:
  std::filesystem::path directory_;
  std::string name_;
  std::string extension_;
  double size_mb_{0.0};
  std::string passphrase_;
  UnitState state_{UnitState::kPending};
  std::string last_diagnostic_;
};

}  // namespace fpg::core
