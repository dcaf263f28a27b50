#include "fpg/core/inventory_scanner.h"

#include <system_error>

#include "fpg/common.h"
#include "fpg/error.h"

namespace fpg::core {

std::string FinalExtension(std::string_view file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string_view::npos) {
    return {};
  }
  return std::string(file_name.substr(dot + 1));
}

std::vector<ProcessingUnit> ScanInventory(const std::filesystem::path& directory,
                                          const orchestrator::BatchConfig& config,
                                          platform::FileOps& file_ops) {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kDirectoryListFailed,
                "Failed to list " + PathToUtf8String(directory) + ": " + ec.message(),
                ec.value()};
  }

  std::vector<ProcessingUnit> units;
  const auto end = std::filesystem::end(it);
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto& entry = *it;
    auto name = PathToUtf8String(entry.path().filename());
    auto extension = FinalExtension(name);
    if (extension.empty() || config.detected_extensions.count(extension) == 0) {
      continue;
    }
    std::error_code type_ec;
    const bool regular = entry.is_regular_file(type_ec);
    if (type_ec && type_ec != std::errc::no_such_file_or_directory) {
      throw Error{ErrorDomain::IO, errors::io::kStatFailed,
                  "Failed to stat " + PathToUtf8String(entry.path()) + ": " + type_ec.message(),
                  type_ec.value()};
    }
    if (!regular) {
      continue;
    }
    const auto size = file_ops.FileSize(entry.path());
    units.emplace_back(directory, std::move(name), std::move(extension), size);
  }
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kDirectoryListFailed,
                "Failed to list " + PathToUtf8String(directory) + ": " + ec.message(),
                ec.value()};
  }
  return units;
}

double TotalSizeMB(const std::vector<ProcessingUnit>& units) {
  double total = 0.0;
  for (const auto& unit : units) {
    total += unit.RoundedSizeMB();
  }
  return RoundTo2(total);
}

}  // namespace fpg::core
