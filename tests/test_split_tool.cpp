#include "fpg/common.h"
#include "fpg/core/processing_unit.h"
#include "fpg/orchestrator/batch_config.h"
#include "fpg/platform/file_ops.h"
#include "fpg/platform/process.h"
#include "fpg/tools/splitter.h"

#include "test_support.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

namespace {

// Stands in for gpg: "encrypts" by copying the input to the output path.
class CopyEncryptor : public fpg::tools::Encryptor {
public:
  std::optional<fpg::tools::ToolCapabilities> QueryCapabilities() override { return std::nullopt; }

  fpg::tools::ToolResult Encrypt(const fpg::tools::EncryptRequest& request) override {
    std::error_code ec;
    std::filesystem::copy_file(request.input, request.output,
                               std::filesystem::copy_options::overwrite_existing, ec);
    fpg::tools::ToolResult result;
    result.exit_code = ec ? 2 : 0;
    result.diagnostic = ec.message();
    return result;
  }
};

void TestCountCreatedPieces() {
  const std::string output =
      "creating file 'a.enc.00'\n"
      "creating file 'a.enc.01'\n"
      "creating file 'a.enc.02'\n";
  assert(fpg::tools::CountCreatedPieces(output) == 3);
  assert(fpg::tools::CountCreatedPieces("") == 0);
  assert(fpg::tools::CountCreatedPieces("split: cannot open 'x'\n") == 0);
}

void TestSplitsRealFile() {
  fpg::testing::TempDir dir("split_tool");
  dir.Touch("archive.zip", static_cast<std::size_t>(fpg::kBytesPerMegabyte * 5 / 2));

  auto config = fpg::orchestrator::DefaultBatchConfig();
  config.split_threshold_mb = 1;
  fpg::platform::PosixFileOps file_ops;
  CopyEncryptor encryptor;
  fpg::tools::CoreutilsSplitter splitter;

  fpg::core::ProcessingUnit unit(dir.path(), "archive.zip", "zip",
                                 file_ops.FileSize(dir.path() / "archive.zip"));
  assert(unit.Encrypt(encryptor, config) == fpg::core::UnitStatus::kOk);

  fpg::core::SplitReport report;
  assert(unit.SplitIfShouldSplit(splitter, file_ops, config, report) == fpg::core::UnitStatus::kOk);
  assert(report.outcome == fpg::core::SplitOutcome::kSplit);
  assert(report.pieces == 3);
  assert(!file_ops.Exists(dir.path() / "archive.zip.enc"));
  assert(file_ops.FileSize(dir.path() / "archive.zip.enc.00") == fpg::kBytesPerMegabyte);
  assert(file_ops.FileSize(dir.path() / "archive.zip.enc.01") == fpg::kBytesPerMegabyte);
  assert(file_ops.FileSize(dir.path() / "archive.zip.enc.02") == fpg::kBytesPerMegabyte / 2);
  assert(!file_ops.Exists(dir.path() / "archive.zip.enc.03"));
  assert(file_ops.Exists(dir.path() / "archive.zip"));
}

// split(1) translates its verbose lines; the count must not depend on that.
void TestPieceCountIgnoresCallerLocale() {
  fpg::testing::TempDir dir("split_locale");
  dir.Touch("a.zip.enc", 3000);

  ::setenv("LANGUAGE", "de", 1);
  ::setenv("LC_ALL", "C.UTF-8", 1);
  fpg::tools::CoreutilsSplitter splitter;
  auto result = splitter.Split(dir.path() / "a.zip.enc", 1000);
  ::unsetenv("LANGUAGE");
  ::unsetenv("LC_ALL");

  assert(result.tool.Succeeded());
  assert(result.pieces == 3);
  assert(std::filesystem::exists(dir.path() / "a.zip.enc.02"));
}

}  // namespace

int main() {
  TestCountCreatedPieces();
  if (!fpg::testing::ProgramAvailable("split")) {
    std::cout << "split not available, skipping\n";
    return 0;
  }
  TestSplitsRealFile();
  TestPieceCountIgnoresCallerLocale();
  std::cout << "split tool ok\n";
  return 0;
}
