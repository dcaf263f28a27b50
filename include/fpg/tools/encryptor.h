#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "fpg/tools/tool_result.h"

namespace fpg::tools {

// Version and algorithm sets reported by the encryption tool.
struct ToolCapabilities {
  std::string raw_output;
  std::string version_line;
  std::set<std::string> ciphers;
  std::set<std::string> digests;

  bool SupportsCipher(std::string_view cipher) const;
  bool SupportsDigest(std::string_view digest) const;
};

struct EncryptRequest {
  std::filesystem::path input;
  std::filesystem::path output;
  std::string_view passphrase;
  std::string_view cipher;
  std::string_view digest;
  int compression_level{0};
};

class Encryptor {
public:
  virtual ~Encryptor() = default;

  // std::nullopt when the tool cannot be invoked or exits non-zero.
  virtual std::optional<ToolCapabilities> QueryCapabilities() = 0;
  virtual ToolResult Encrypt(const EncryptRequest& request) = 0;
};

// Symmetric encryption through the GnuPG command line in batch mode. The
// passphrase is handed over on the child's stdin, never on its command line.
class GpgEncryptor : public Encryptor {
public:
  // An empty |program| resolves FPG_GPG, then "gpg" on PATH.
  explicit GpgEncryptor(std::string program = {});

  std::optional<ToolCapabilities> QueryCapabilities() override;
  ToolResult Encrypt(const EncryptRequest& request) override;

  const std::string& Program() const noexcept { return program_; }

private:
  std::string program_;
};

// Parses `gpg --version` output: the first line is the version banner, and the
// "Cipher:" and "Hash:" sections list algorithms separated by commas,
// continuing on indented lines.
ToolCapabilities ParseGpgVersionOutput(std::string_view text);

}  // namespace fpg::tools
