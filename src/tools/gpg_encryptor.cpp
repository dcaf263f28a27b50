#include "fpg/tools/encryptor.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "fpg/common.h"
#include "fpg/platform/process.h"
#include "fpg/security/zeroizer.h"

namespace fpg::tools {
namespace {

constexpr std::string_view kDefaultGpgProgram = "gpg";

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

std::string ToUpper(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char ch : text) {
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
  }
  return out;
}

void AddAlgorithms(std::string_view list, std::set<std::string>& out) {
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string_view::npos) {
      end = list.size();
    }
    auto token = Trim(list.substr(start, end - start));
    if (!token.empty()) {
      out.insert(ToUpper(token));
    }
    start = end + 1;
  }
}

std::string ResolveProgram(std::string program) {
  if (!program.empty()) {
    return program;
  }
  const char* env = std::getenv("FPG_GPG");
  if (env && *env != '\0') {
    return std::string(env);
  }
  return std::string(kDefaultGpgProgram);
}

}  // namespace

bool ToolCapabilities::SupportsCipher(std::string_view cipher) const {
  return ciphers.count(ToUpper(cipher)) != 0;
}

bool ToolCapabilities::SupportsDigest(std::string_view digest) const {
  return digests.count(ToUpper(digest)) != 0;
}

ToolCapabilities ParseGpgVersionOutput(std::string_view text) {
  ToolCapabilities caps;
  caps.raw_output = std::string(text);

  std::set<std::string>* section = nullptr;
  bool first_line = true;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    start = end + 1;
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (first_line) {
      caps.version_line = std::string(line);
      first_line = false;
      continue;
    }
    if (line.empty()) {
      section = nullptr;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(line.front())) != 0) {
      if (section != nullptr) {
        AddAlgorithms(line, *section);
      }
      continue;
    }

    const size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
      section = nullptr;
      continue;
    }
    const auto name = Trim(line.substr(0, colon));
    if (name == "Cipher") {
      section = &caps.ciphers;
    } else if (name == "Hash") {
      section = &caps.digests;
    } else {
      section = nullptr;
    }
    if (section != nullptr) {
      AddAlgorithms(line.substr(colon + 1), *section);
    }
  }
  return caps;
}

GpgEncryptor::GpgEncryptor(std::string program) : program_(ResolveProgram(std::move(program))) {}

std::optional<ToolCapabilities> GpgEncryptor::QueryCapabilities() {
  auto result = platform::RunProcess({program_, "--version"});
  if (!result.Succeeded()) {
    return std::nullopt;
  }
  return ParseGpgVersionOutput(result.stdout_text);
}

ToolResult GpgEncryptor::Encrypt(const EncryptRequest& request) {
  const std::vector<std::string> argv = {
      program_,
      "--batch",
      "--pinentry-mode", "loopback",
      "--passphrase-fd", "0",
      "--digest-algo", std::string(request.digest),
      "--symmetric",
      "--cipher-algo", std::string(request.cipher),
      "--compress-level", std::to_string(request.compression_level),
      "--output", PathToUtf8String(request.output),
      PathToUtf8String(request.input),
  };

  platform::ProcessOptions options;
  options.stdin_payload = std::string(request.passphrase) + "\n";
  options.merge_stderr = true;

  auto result = platform::RunProcess(argv, options);
  security::Zeroizer::WipeString(*options.stdin_payload);

  ToolResult out;
  out.exit_code = result.launched ? result.exit_code : -1;
  out.diagnostic = std::string(Trim(result.stdout_text));
  if (!result.launched) {
    out.diagnostic = "unable to execute " + program_;
  }
  return out;
}

}  // namespace fpg::tools
