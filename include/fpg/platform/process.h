#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fpg::platform {

struct ProcessResult {
  int exit_code{-1};
  bool launched{false}; // false when the program could not be executed at all
  std::string stdout_text;

  bool Succeeded() const noexcept { return launched && exit_code == 0; }
};

struct ProcessOptions {
  std::optional<std::string> stdin_payload; // written to the child's stdin, then closed
  bool capture_stdout{true};
  bool merge_stderr{false};                 // route the child's stderr into the captured output
  std::vector<std::pair<std::string, std::string>> environment; // set in the child only
  std::vector<std::string> unset_environment;                   // removed in the child only
};

// Runs |argv| (argv[0] resolved on PATH) and blocks until it exits. There is no
// timeout: a hung child hangs the caller. Throws fpg::Error when the pipes or
// the fork itself cannot be created.
ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options = {});

}  // namespace fpg::platform
