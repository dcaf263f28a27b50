#include "fpg/tools/splitter.h"

#include <string>
#include <vector>

#include "fpg/common.h"
#include "fpg/platform/process.h"

namespace fpg::tools {

std::size_t CountCreatedPieces(std::string_view verbose_output) {
  constexpr std::string_view kMarker = "creating file";
  std::size_t count = 0;
  size_t start = 0;
  while (start < verbose_output.size()) {
    size_t end = verbose_output.find('\n', start);
    if (end == std::string_view::npos) {
      end = verbose_output.size();
    }
    if (verbose_output.substr(start, end - start).rfind(kMarker, 0) == 0) {
      ++count;
    }
    start = end + 1;
  }
  return count;
}

SplitResult CoreutilsSplitter::Split(const std::filesystem::path& input, std::uint64_t chunk_bytes) {
  const std::string source = PathToUtf8String(input);
  const std::vector<std::string> argv = {
      "split",
      "--verbose",
      "--bytes=" + std::to_string(chunk_bytes),
      "--numeric-suffixes",
      "--suffix-length=2",
      source,
      source + ".",
  };

  // The verbose lines are translated; force the untranslated form we count.
  platform::ProcessOptions options;
  options.environment = {{"LC_ALL", "C"}};
  options.unset_environment = {"LANGUAGE"};
  auto process = platform::RunProcess(argv, options);
  SplitResult result;
  result.tool.exit_code = process.launched ? process.exit_code : -1;
  if (!process.launched) {
    result.tool.diagnostic = "unable to execute split";
    return result;
  }
  result.pieces = CountCreatedPieces(process.stdout_text);
  return result;
}

}  // namespace fpg::tools
