#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "fpg/core/processing_unit.h"
#include "fpg/orchestrator/batch_config.h"
#include "fpg/platform/file_ops.h"

namespace fpg::core {

// Text after the last '.', or empty when |file_name| has none.
std::string FinalExtension(std::string_view file_name);

// Builds one unit per regular file in |directory| whose final extension is in
// config.detected_extensions. Units follow directory listing order. Listing
// failures, and stat failures on a candidate, throw fpg::Error (IO); a
// candidate that vanished during the scan is skipped.
std::vector<ProcessingUnit> ScanInventory(const std::filesystem::path& directory,
                                          const orchestrator::BatchConfig& config,
                                          platform::FileOps& file_ops);

// Sum of the per-unit sizes after each is rounded to two decimals.
double TotalSizeMB(const std::vector<ProcessingUnit>& units);

}  // namespace fpg::core
