#include "fpg/orchestrator/batch_orchestrator.h"

#include <chrono>
#include <istream>
#include <ostream>
#include <utility>

#include "fpg/common.h"
#include "fpg/core/environment_validator.h"
#include "fpg/core/inventory_scanner.h"
#include "fpg/crypto/random.h"
#include "fpg/error.h"
#include "fpg/errors.h"
#include "fpg/orchestrator/event_bus.h"
#include "fpg/security/zeroizer.h"

namespace fpg::orchestrator {

namespace {

constexpr std::string_view kSeparator = "...........................................";

double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

EventField HashedName(const std::string& name) {
  return EventField("file", name, FieldPrivacy::kHash);
}

EventField Number(std::string key, double value) {
  return EventField(std::move(key), FormatTwoDecimals(value), FieldPrivacy::kPublic, true);
}

bool IsReservedName(const std::string& name) {
  return name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos;
}

}  // namespace

std::string_view ToString(PipelineState state) {
  switch (state) {
    case PipelineState::kValidate:
      return "Validate";
    case PipelineState::kScan:
      return "Scan";
    case PipelineState::kSpaceCheck:
      return "SpaceCheck";
    case PipelineState::kListing:
      return "Listing";
    case PipelineState::kConfirm:
      return "Confirm";
    case PipelineState::kEncryptAll:
      return "EncryptAll";
    case PipelineState::kRevealPrompt:
      return "RevealPrompt";
    case PipelineState::kKeyReveal:
      return "KeyReveal";
    case PipelineState::kRenamePrompt:
      return "RenamePrompt";
    case PipelineState::kRenameAll:
      return "RenameAll";
    case PipelineState::kSplitAll:
      return "SplitAll";
    case PipelineState::kDone:
      return "Done";
    case PipelineState::kAborted:
      return "Aborted";
  }
  return "Unknown";
}

BatchOrchestrator::BatchOrchestrator(BatchConfig config, BatchBackends backends,
                                     std::filesystem::path directory, std::string platform,
                                     std::istream& in, std::ostream& out)
    : config_(std::move(config)),
      backends_(backends),
      directory_(std::move(directory)),
      platform_(std::move(platform)),
      in_(in),
      out_(out) {}

RunOutcome BatchOrchestrator::Run() {
  while (state_ != PipelineState::kDone && state_ != PipelineState::kAborted) {
    switch (state_) {
      case PipelineState::kValidate:
        state_ = Validate();
        break;
      case PipelineState::kScan:
        state_ = Scan();
        break;
      case PipelineState::kSpaceCheck:
        state_ = SpaceCheck();
        break;
      case PipelineState::kListing:
        state_ = Listing();
        break;
      case PipelineState::kConfirm:
        state_ = Confirm();
        break;
      case PipelineState::kEncryptAll:
        state_ = EncryptAll();
        break;
      case PipelineState::kRevealPrompt:
        state_ = RevealPrompt();
        break;
      case PipelineState::kKeyReveal:
        state_ = KeyReveal();
        break;
      case PipelineState::kRenamePrompt:
        state_ = RenamePrompt();
        break;
      case PipelineState::kRenameAll:
        state_ = RenameAll();
        break;
      case PipelineState::kSplitAll:
        state_ = SplitAll();
        break;
      case PipelineState::kDone:
      case PipelineState::kAborted:
        break;
    }
  }

  if (state_ == PipelineState::kDone) {
    PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "run_completed",
                 "Batch completed",
                 {EventField("files", std::to_string(units_.size()), FieldPrivacy::kPublic, true),
                  Number("encryption_seconds", total_encryption_seconds_)});
    return RunOutcome::kCompleted;
  }
  return RunOutcome::kAborted;
}

PipelineState BatchOrchestrator::Validate() {
  const auto outcome = core::ValidateEnvironment(platform_, backends_.encryptor, config_);
  if (outcome != core::ValidationOutcome::kValid) {
    out_ << core::Describe(outcome) << " Exiting.\n";
    PublishEvent(EventSeverity::kError, EventCategory::kLifecycle, "validation_failed",
                 std::string(core::Describe(outcome)),
                 {EventField("platform", platform_)});
    return Abort("validation");
  }
  out_ << errors::msg::kValidated << "\n\n";
  return PipelineState::kScan;
}

PipelineState BatchOrchestrator::Scan() {
  units_ = core::ScanInventory(directory_, config_, backends_.file_ops);
  PublishEvent(EventSeverity::kInfo, EventCategory::kTelemetry, "inventory_scanned",
               "Inventory scanned",
               {EventField("files", std::to_string(units_.size()), FieldPrivacy::kPublic, true)});
  if (units_.empty()) {
    out_ << errors::msg::kNoSupportedFiles << " Exiting.\n";
    return Abort("empty inventory");
  }
  return PipelineState::kSpaceCheck;
}

PipelineState BatchOrchestrator::SpaceCheck() {
  const double free_mb = RoundTo2(BytesToMegabytes(backends_.file_ops.FreeSpace(directory_)));
  const double total_mb = core::TotalSizeMB(units_);
  out_ << "Free space: " << FormatTwoDecimals(free_mb) << " MB\n\n";
  out_ << "Total file size " << FormatTwoDecimals(total_mb) << " MB\n";
  if (free_mb < total_mb) {
    out_ << errors::msg::kSpaceAdvisory << "\n";
    PublishEvent(EventSeverity::kWarning, EventCategory::kDiagnostics, "space_advisory",
                 std::string(errors::msg::kSpaceAdvisory),
                 {Number("free_mb", free_mb), Number("total_mb", total_mb)});
  }
  return PipelineState::kListing;
}

PipelineState BatchOrchestrator::Listing() {
  out_ << units_.size() << " files detected:\n\n";
  for (const auto& unit : units_) {
    out_ << unit.Name() << " - " << FormatTwoDecimals(unit.RoundedSizeMB()) << " MB\n";
  }
  out_ << kSeparator << "\n";
  out_ << config_.cipher_id << ' ' << config_.digest_id << ' ' << config_.passphrase_length
       << "-char-passphrases " << config_.split_threshold_mb << "-MB-splitting "
       << config_.output_extension << "-extension " << config_.compression_level
       << "-compression\n\n";
  return PipelineState::kConfirm;
}

PipelineState BatchOrchestrator::Confirm() {
  std::string answer;
  if (!Prompt("Enter 'y' to begin encryption with above parameters", answer) || answer != "y") {
    return Abort("not confirmed");
  }
  return PipelineState::kEncryptAll;
}

PipelineState BatchOrchestrator::EncryptAll() {
  const auto overall_start = std::chrono::steady_clock::now();
  for (auto& unit : units_) {
    out_ << "Working on " << unit.Name() << ", " << FormatTwoDecimals(unit.RoundedSizeMB())
         << " MB\n";
    const auto start = std::chrono::steady_clock::now();
    const auto status = unit.Encrypt(backends_.encryptor, config_);
    const double seconds = SecondsSince(start);

    if (status != core::UnitStatus::kOk) {
      out_ << "GPG error during encryption of " << unit.Name() << "!\n";
      if (!unit.LastDiagnostic().empty()) {
        out_ << unit.LastDiagnostic() << "\n";
      }
      PublishEvent(EventSeverity::kError, EventCategory::kDiagnostics, "unit_encryption_failed",
                   std::string(core::ToString(status)), {HashedName(unit.Name())});
      return RecoverFromEncryptionFailure();
    }

    out_ << unit.Name() << " encrypted in " << FormatTwoDecimals(seconds) << " sec\n\n";
    out_ << "Average speed: " << FormatTwoDecimals(unit.EncryptionSpeed(seconds)) << " MB/s\n\n";
    PublishEvent(EventSeverity::kInfo, EventCategory::kTelemetry, "unit_encrypted",
                 "Unit encrypted",
                 {HashedName(unit.Name()), Number("size_mb", unit.RoundedSizeMB()),
                  Number("seconds", seconds), Number("mb_per_s", unit.EncryptionSpeed(seconds))});
  }
  total_encryption_seconds_ = SecondsSince(overall_start);
  out_ << "All files encrypted in " << FormatTwoDecimals(total_encryption_seconds_) << "s\n\n";
  return PipelineState::kRevealPrompt;
}

PipelineState BatchOrchestrator::RecoverFromEncryptionFailure() {
  std::string answer;
  while (true) {
    if (!Prompt("Enter 'v' to view keys, 'q' to quit", answer)) {
      PrintKeys();
      return Abort("encryption failed");
    }
    if (answer == "q") {
      return Abort("encryption failed");
    }
    if (answer == "v") {
      PrintKeys();
      return Abort("encryption failed");
    }
  }
}

PipelineState BatchOrchestrator::RevealPrompt() {
  std::string answer;
  while (answer != "v") {
    if (!Prompt("Enter 'v' to view passphrases", answer)) {
      break;
    }
  }
  return PipelineState::kKeyReveal;
}

PipelineState BatchOrchestrator::KeyReveal() {
  PrintKeys();
  out_ << errors::msg::kOnlyChance << "\n";
  return PipelineState::kRenamePrompt;
}

void BatchOrchestrator::PrintKeys() {
  std::size_t revealed = 0;
  std::string passphrase;
  for (const auto& unit : units_) {
    if (unit.GetPassphrase(passphrase) != core::UnitStatus::kOk) {
      continue;
    }
    out_ << unit.Name() << " : " << passphrase << "\n\n";
    ++revealed;
  }
  security::Zeroizer::WipeString(passphrase);
  out_.flush();
  PublishEvent(EventSeverity::kInfo, EventCategory::kSecurity, "keys_revealed",
               "Passphrases shown to operator",
               {EventField("count", std::to_string(revealed), FieldPrivacy::kPublic, true)});
}

PipelineState BatchOrchestrator::RenamePrompt() {
  std::string answer;
  Prompt("Enter 'r' for renaming, 'x' for random names, other key to skip", answer);
  if (answer == "r") {
    rename_mode_ = RenameMode::kManual;
  } else if (answer == "x") {
    rename_mode_ = RenameMode::kRandom;
  } else {
    rename_mode_ = RenameMode::kSkip;
    return PipelineState::kSplitAll;
  }
  return PipelineState::kRenameAll;
}

PipelineState BatchOrchestrator::RenameAll() {
  for (auto& unit : units_) {
    if (rename_mode_ == RenameMode::kManual) {
      RenameManually(unit);
    } else if (rename_mode_ == RenameMode::kRandom) {
      RenameRandomly(unit);
    }
    if (rename_mode_ == RenameMode::kSkip) {
      break;
    }
  }
  return PipelineState::kSplitAll;
}

void BatchOrchestrator::RenameManually(core::ProcessingUnit& unit) {
  out_ << "For file: " << unit.Name() << "\n";
  std::string answer;
  while (true) {
    if (!Prompt("Enter new name: ", answer)) {
      // Input ended; the remaining files keep their names.
      rename_mode_ = RenameMode::kSkip;
      return;
    }
    if (answer == unit.Name()) {
      out_ << "Renamed\n\n";
      return;
    }
    if (IsReservedName(answer)) {
      out_ << errors::msg::kNameRejected << "\n";
      continue;
    }
    if (!NameAvailable(answer)) {
      out_ << errors::msg::kNameTaken << "\n";
      continue;
    }
    break;
  }
  const std::string previous = unit.Name();
  unit.Rename(answer, backends_.file_ops, config_);
  out_ << "Renamed\n\n";
  PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "unit_renamed", "Unit renamed",
               {EventField("from", previous, FieldPrivacy::kHash),
                EventField("to", unit.Name(), FieldPrivacy::kHash),
                EventField("mode", "manual")});
}

void BatchOrchestrator::RenameRandomly(core::ProcessingUnit& unit) {
  std::string candidate;
  do {
    candidate = config_.random_rename_prefix +
                crypto::RandomDigits(config_.random_rename_digit_count) + "." + unit.Extension();
  } while (!NameAvailable(candidate));

  const std::string previous = unit.Name();
  unit.Rename(candidate, backends_.file_ops, config_);
  out_ << previous << " renamed to " << unit.Name() << "\n";
  PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "unit_renamed", "Unit renamed",
               {EventField("from", previous, FieldPrivacy::kHash),
                EventField("to", unit.Name(), FieldPrivacy::kHash),
                EventField("mode", "random")});
}

bool BatchOrchestrator::NameAvailable(const std::string& name) {
  return !backends_.file_ops.Exists(directory_ / (name + config_.output_extension));
}

PipelineState BatchOrchestrator::SplitAll() {
  out_ << "Splitting files if needed...\n";
  for (auto& unit : units_) {
    core::SplitReport report;
    const auto status = unit.SplitIfShouldSplit(backends_.splitter, backends_.file_ops, config_,
                                                report);
    if (status != core::UnitStatus::kOk) {
      // Every unit is encrypted by now; a pending one here is a pipeline bug.
      throw Error{ErrorDomain::State, errors::state::kUnitNotEncrypted,
                  "Cannot split " + unit.Name() + ": " + std::string(core::ToString(status))};
    }
    if (report.outcome == core::SplitOutcome::kSplit) {
      out_ << unit.Name() << " was split into " << report.pieces << " pieces\n";
    } else {
      out_ << unit.Name() << " was not split\n";
    }
    PublishEvent(EventSeverity::kInfo, EventCategory::kTelemetry, "unit_split",
                 report.outcome == core::SplitOutcome::kSplit ? "Unit split" : "Unit not split",
                 {HashedName(unit.Name()),
                  EventField("pieces", std::to_string(report.pieces), FieldPrivacy::kPublic,
                             true)});
  }
  return PipelineState::kDone;
}

bool BatchOrchestrator::Prompt(std::string_view text, std::string& answer) {
  out_ << text << "\n";
  out_.flush();
  answer.clear();
  if (!std::getline(in_, answer)) {
    return false;
  }
  if (!answer.empty() && answer.back() == '\r') {
    answer.pop_back();
  }
  return true;
}

PipelineState BatchOrchestrator::Abort(std::string_view reason) {
  PublishEvent(EventSeverity::kWarning, EventCategory::kLifecycle, "run_aborted", "Batch aborted",
               {EventField("reason", std::string(reason)),
                EventField("stage", std::string(ToString(state_)))});
  return PipelineState::kAborted;
}

}  // namespace fpg::orchestrator
