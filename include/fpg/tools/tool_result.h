#pragma once

#include <string>

namespace fpg::tools {

struct ToolResult {
  int exit_code{-1};
  std::string diagnostic;

  bool Succeeded() const noexcept { return exit_code == 0; }
};

}  // namespace fpg::tools
