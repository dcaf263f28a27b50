#include "fpg/core/processing_unit.h"

#include <utility>

#include "fpg/common.h"
#include "fpg/crypto/random.h"
#include "fpg/error.h"
#include "fpg/errors.h"
#include "fpg/security/zeroizer.h"

namespace fpg::core {

std::string_view ToString(UnitStatus status) {
  switch (status) {
    case UnitStatus::kOk:
      return "Ok";
    case UnitStatus::kInvalidState:
      return "File has not been encrypted yet";
    case UnitStatus::kToolFailure:
      return "Encryption tool failed";
  }
  return "UnknownStatus";
}

ProcessingUnit::ProcessingUnit(std::filesystem::path directory, std::string name,
                               std::string extension, std::uint64_t size_bytes)
    : directory_(std::move(directory)),
      name_(std::move(name)),
      extension_(std::move(extension)),
      size_mb_(BytesToMegabytes(size_bytes)) {}

ProcessingUnit::~ProcessingUnit() { security::Zeroizer::WipeString(passphrase_); }

ProcessingUnit::ProcessingUnit(ProcessingUnit&& other) noexcept
    : directory_(std::move(other.directory_)),
      name_(std::move(other.name_)),
      extension_(std::move(other.extension_)),
      size_mb_(other.size_mb_),
      passphrase_(std::move(other.passphrase_)),
      state_(other.state_),
      last_diagnostic_(std::move(other.last_diagnostic_)) {
  security::Zeroizer::WipeString(other.passphrase_);
  other.state_ = UnitState::kPending;
}

ProcessingUnit& ProcessingUnit::operator=(ProcessingUnit&& other) noexcept {
  if (this != &other) {
    security::Zeroizer::WipeString(passphrase_);
    directory_ = std::move(other.directory_);
    name_ = std::move(other.name_);
    extension_ = std::move(other.extension_);
    size_mb_ = other.size_mb_;
    passphrase_ = std::move(other.passphrase_);
    state_ = other.state_;
    last_diagnostic_ = std::move(other.last_diagnostic_);
    security::Zeroizer::WipeString(other.passphrase_);
    other.state_ = UnitState::kPending;
  }
  return *this;
}

UnitStatus ProcessingUnit::Encrypt(tools::Encryptor& encryptor,
                                   const orchestrator::BatchConfig& config) {
  if (state_ == UnitState::kEncrypted) {
    return UnitStatus::kInvalidState;
  }
  std::string passphrase = crypto::GeneratePassphrase(config.passphrase_length);

  tools::EncryptRequest request;
  request.input = directory_ / name_;
  request.output = EncryptedPath(config);
  request.passphrase = passphrase;
  request.cipher = config.cipher_id;
  request.digest = config.digest_id;
  request.compression_level = config.compression_level;

  auto result = encryptor.Encrypt(request);
  last_diagnostic_ = result.diagnostic;
  if (!result.Succeeded()) {
    security::Zeroizer::WipeString(passphrase);
    return UnitStatus::kToolFailure;
  }
  passphrase_ = std::move(passphrase);
  state_ = UnitState::kEncrypted;
  return UnitStatus::kOk;
}

UnitStatus ProcessingUnit::SplitIfShouldSplit(tools::Splitter& splitter,
                                              platform::FileOps& file_ops,
                                              const orchestrator::BatchConfig& config,
                                              SplitReport& report) {
  if (state_ != UnitState::kEncrypted) {
    return UnitStatus::kInvalidState;
  }
  // Decided on the size recorded before encryption; ciphertext overhead is
  // not taken into account.
  if (size_mb_ <= static_cast<double>(config.split_threshold_mb)) {
    report = SplitReport{SplitOutcome::kNotSplit, 1};
    return UnitStatus::kOk;
  }

  const auto combined = EncryptedPath(config);
  auto result = splitter.Split(combined, config.split_threshold_mb * kBytesPerMegabyte);
  if (!result.tool.Succeeded()) {
    throw Error{ErrorDomain::Dependency, errors::dependency::kSplitFailed,
                "Failed to split " + PathToUtf8String(combined) +
                    (result.tool.diagnostic.empty() ? std::string{} : ": " + result.tool.diagnostic),
                result.tool.exit_code};
  }
  file_ops.Remove(combined);
  report = SplitReport{SplitOutcome::kSplit, result.pieces};
  return UnitStatus::kOk;
}

void ProcessingUnit::Rename(std::string new_name, platform::FileOps& file_ops,
                            const orchestrator::BatchConfig& config) {
  if (new_name.empty() || new_name.find('/') != std::string::npos || new_name == "." ||
      new_name == "..") {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidName,
                std::string(errors::msg::kNameRejected)};
  }
  const auto from = EncryptedPath(config);
  const auto to = directory_ / (new_name + config.output_extension);
  file_ops.Rename(from, to);
  name_ = std::move(new_name);
}

UnitStatus ProcessingUnit::GetPassphrase(std::string& out) const {
  if (state_ != UnitState::kEncrypted) {
    return UnitStatus::kInvalidState;
  }
  out = passphrase_;
  return UnitStatus::kOk;
}

double ProcessingUnit::RoundedSizeMB() const noexcept { return RoundTo2(size_mb_); }

double ProcessingUnit::EncryptionSpeed(double seconds) const noexcept {
  if (seconds <= 0.0) {
    return 0.0;
  }
  return RoundTo2(size_mb_ / seconds);
}

std::filesystem::path ProcessingUnit::EncryptedPath(const orchestrator::BatchConfig& config) const {
  return directory_ / EncryptedFileName(config);
}

}  // namespace fpg::core
