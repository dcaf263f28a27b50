#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string_view>

#include "fpg/tools/tool_result.h"

namespace fpg::tools {

struct SplitResult {
  ToolResult tool;
  std::size_t pieces{0};
};

class Splitter {
public:
  virtual ~Splitter() = default;

  // Splits |input| into |chunk_bytes|-sized pieces named |input|.00, .01, ...
  // The input file itself is left in place.
  virtual SplitResult Split(const std::filesystem::path& input, std::uint64_t chunk_bytes) = 0;
};

// Chunking through coreutils split(1) with two-digit numeric suffixes. split
// runs in the C locale regardless of the caller's LANGUAGE/LC_* settings.
class CoreutilsSplitter : public Splitter {
public:
  SplitResult Split(const std::filesystem::path& input, std::uint64_t chunk_bytes) override;
};

// Counts the "creating file" lines split(1) prints in verbose mode.
std::size_t CountCreatedPieces(std::string_view verbose_output);

}  // namespace fpg::tools
