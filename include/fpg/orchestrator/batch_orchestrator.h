#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "fpg/core/processing_unit.h"
#include "fpg/orchestrator/batch_config.h"
#include "fpg/platform/file_ops.h"
#include "fpg/tools/encryptor.h"
#include "fpg/tools/splitter.h"

namespace fpg::orchestrator {

// Stages of one run, in the order they execute. kDone and kAborted are terminal.
enum class PipelineState {
  kValidate,
  kScan,
  kSpaceCheck,
  kListing,
  kConfirm,
  kEncryptAll,
  kRevealPrompt,
  kKeyReveal,
  kRenamePrompt,
  kRenameAll,
  kSplitAll,
  kDone,
  kAborted,
};

std::string_view ToString(PipelineState state);

enum class RunOutcome { kCompleted, kAborted };

enum class RenameMode { kSkip, kManual, kRandom };

// External collaborators of a run. All three must outlive the orchestrator.
struct BatchBackends {
  tools::Encryptor& encryptor;
  tools::Splitter& splitter;
  platform::FileOps& file_ops;
};

// Drives validate -> scan -> confirm -> encrypt -> reveal -> rename -> split
// over every file of one directory. Operator interaction goes through |in| and
// |out| so the whole pipeline can be scripted.
class BatchOrchestrator {
public:
  BatchOrchestrator(BatchConfig config, BatchBackends backends, std::filesystem::path directory,
                    std::string platform, std::istream& in, std::ostream& out);

  // Runs the pipeline to completion or abort. Rename, split and removal
  // failures propagate as fpg::Error.
  RunOutcome Run();

  PipelineState State() const noexcept { return state_; }
  const std::vector<core::ProcessingUnit>& Units() const noexcept { return units_; }
  const BatchConfig& Config() const noexcept { return config_; }

private:
  PipelineState Validate();
  PipelineState Scan();
  PipelineState SpaceCheck();
  PipelineState Listing();
  PipelineState Confirm();
  PipelineState EncryptAll();
  PipelineState RevealPrompt();
  PipelineState KeyReveal();
  PipelineState RenamePrompt();
  PipelineState RenameAll();
  PipelineState SplitAll();

  // Prints the keys captured so far, then gives up on the batch.
  PipelineState RecoverFromEncryptionFailure();
  void PrintKeys();
  void RenameManually(core::ProcessingUnit& unit);
  void RenameRandomly(core::ProcessingUnit& unit);
  bool NameAvailable(const std::string& name);

  bool Prompt(std::string_view text, std::string& answer);
  PipelineState Abort(std::string_view reason);

  BatchConfig config_;
  BatchBackends backends_;
  std::filesystem::path directory_;
  std::string platform_;
  std::istream& in_;
  std::ostream& out_;

  PipelineState state_{PipelineState::kValidate};
  std::vector<core::ProcessingUnit> units_;
  RenameMode rename_mode_{RenameMode::kSkip};
  double total_encryption_seconds_{0.0};
};

}  // namespace fpg::orchestrator
