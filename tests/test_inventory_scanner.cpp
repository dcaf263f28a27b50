#include "fpg/core/inventory_scanner.h"
#include "fpg/error.h"
#include "fpg/orchestrator/batch_config.h"
#include "fpg/platform/file_ops.h"

#include "test_support.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <set>
#include <string>

namespace {

using fpg::core::FinalExtension;
using fpg::core::ScanInventory;
using fpg::core::TotalSizeMB;

std::set<std::string> Names(const std::vector<fpg::core::ProcessingUnit>& units) {
  std::set<std::string> names;
  for (const auto& unit : units) {
    names.insert(unit.Name());
  }
  return names;
}

void TestFinalExtension() {
  assert(FinalExtension("a.zip") == "zip");
  assert(FinalExtension("backup.tar.7z") == "7z");
  assert(FinalExtension("README") == "");
  assert(FinalExtension("trailing.") == "");
}

void TestFiltersByExtension() {
  fpg::testing::TempDir dir("scan");
  dir.Touch("photos.zip");
  dir.Touch("music.7z");
  dir.Touch("notes.txt");
  dir.Touch("archive.zip.enc");
  dir.Touch("fakezip");
  dir.Touch("upper.ZIP");
  std::filesystem::create_directories(dir.path() / "folder.zip");

  fpg::platform::PosixFileOps file_ops;
  auto units = ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  assert(units.size() == 2);
  auto names = Names(units);
  assert(names.count("photos.zip") == 1);
  assert(names.count("music.7z") == 1);
  for (const auto& unit : units) {
    assert(unit.Extension() == fpg::core::FinalExtension(unit.Name()));
    assert(!unit.IsEncrypted());
  }
}

void TestEmptyDirectory() {
  fpg::testing::TempDir dir("scan_empty");
  dir.Touch("notes.txt");
  fpg::platform::PosixFileOps file_ops;
  auto units = ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  assert(units.empty());
  assert(TotalSizeMB(units) == 0.0);
}

void TestTotalsUseRoundedSizes() {
  fpg::testing::TempDir dir("scan_sizes");
  dir.Touch("a.zip");
  dir.Touch("b.zip");
  fpg::testing::FakeFileOps file_ops;
  // 1.004 MB and 2.004 MB round to 1.0 and 2.0 individually.
  file_ops.sizes[dir.path() / "a.zip"] = 1052770;
  file_ops.sizes[dir.path() / "b.zip"] = 2101346;
  auto units = ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  assert(units.size() == 2);
  assert(TotalSizeMB(units) == 3.0);
}

void TestCandidateStatFailureAbortsScan() {
  fpg::testing::TempDir dir("scan_stat");
  dir.Touch("a.zip");
  dir.Touch("b.zip");
  fpg::testing::FakeFileOps file_ops;
  file_ops.stat_failures.insert(dir.path() / "b.zip");
  bool threw = false;
  try {
    (void)ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  } catch (const fpg::Error& err) {
    threw = err.domain == fpg::ErrorDomain::IO && err.code == fpg::errors::io::kStatFailed;
  }
  assert(threw);
}

void TestUnresolvableCandidateAbortsScan() {
  fpg::testing::TempDir dir("scan_loop");
  dir.Touch("a.zip");
  // A self-referencing link cannot be resolved to a file type (ELOOP).
  std::filesystem::create_symlink("loop.zip", dir.path() / "loop.zip");
  fpg::platform::PosixFileOps file_ops;
  bool threw = false;
  try {
    (void)ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  } catch (const fpg::Error& err) {
    threw = err.domain == fpg::ErrorDomain::IO && err.code == fpg::errors::io::kStatFailed &&
            err.native_code.has_value();
  }
  assert(threw);
}

void TestUnresolvableNonCandidateIgnored() {
  fpg::testing::TempDir dir("scan_loop_other");
  dir.Touch("a.zip");
  std::filesystem::create_symlink("loop.txt", dir.path() / "loop.txt");
  std::filesystem::create_symlink("missing.zip", dir.path() / "dangling.zip");
  fpg::platform::PosixFileOps file_ops;
  auto units = ScanInventory(dir.path(), fpg::orchestrator::DefaultBatchConfig(), file_ops);
  assert(units.size() == 1);
  assert(units.front().Name() == "a.zip");
}

void TestMissingDirectoryThrows() {
  fpg::platform::PosixFileOps file_ops;
  bool threw = false;
  try {
    (void)ScanInventory("/nonexistent/fpg/scan", fpg::orchestrator::DefaultBatchConfig(), file_ops);
  } catch (const fpg::Error& err) {
    threw = err.domain == fpg::ErrorDomain::IO &&
            err.code == fpg::errors::io::kDirectoryListFailed;
  }
  assert(threw);
}

}  // namespace

int main() {
  TestFinalExtension();
  TestFiltersByExtension();
  TestEmptyDirectory();
  TestTotalsUseRoundedSizes();
  TestCandidateStatFailureAbortsScan();
  TestUnresolvableCandidateAbortsScan();
  TestUnresolvableNonCandidateIgnored();
  TestMissingDirectoryThrows();
  std::cout << "inventory scanner ok\n";
  return 0;
}
