#include "fpg/platform/file_ops.h"
#include "fpg/platform/process.h"
#include "fpg/error.h"
#include "fpg/tools/encryptor.h"

#include "test_support.h"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <sys/stat.h>

namespace {

using fpg::platform::ProcessOptions;
using fpg::platform::RunProcess;
using fpg::testing::Contains;

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestCapturesStdout() {
  auto result = RunProcess({"echo", "hello"});
  assert(result.launched);
  assert(result.Succeeded());
  assert(result.stdout_text == "hello\n");
}

void TestStdinPayload() {
  ProcessOptions options;
  options.stdin_payload = std::string("secret-line\n");
  auto result = RunProcess({"cat"}, options);
  assert(result.Succeeded());
  assert(result.stdout_text == "secret-line\n");
}

void TestExitStatus() {
  auto result = RunProcess({"sh", "-c", "echo oops >&2; exit 3"}, ProcessOptions{std::nullopt, true, true});
  assert(result.launched);
  assert(result.exit_code == 3);
  assert(!result.Succeeded());
  assert(Contains(result.stdout_text, "oops"));
}

void TestEnvironmentOverride() {
  ::setenv("FPG_TEST_REMOVED", "parent", 1);
  ProcessOptions options;
  options.environment = {{"FPG_TEST_VALUE", "child"}};
  options.unset_environment = {"FPG_TEST_REMOVED"};
  auto result = RunProcess(
      {"sh", "-c", "printf '%s|%s' \"$FPG_TEST_VALUE\" \"${FPG_TEST_REMOVED:-unset}\""}, options);
  assert(result.Succeeded());
  assert(result.stdout_text == "child|unset");

  // The parent's environment is untouched.
  assert(std::getenv("FPG_TEST_VALUE") == nullptr);
  assert(std::string(std::getenv("FPG_TEST_REMOVED")) == "parent");
  ::unsetenv("FPG_TEST_REMOVED");
}

void TestMissingProgram() {
  auto result = RunProcess({"fpg-definitely-not-installed"});
  assert(!result.launched);
  assert(!result.Succeeded());
}

// Drives GpgEncryptor against a script that records what it was handed.
void TestGpgEncryptorArguments() {
  fpg::testing::TempDir dir("gpg_stub");
  const auto script = dir.path() / "gpg";
  {
    std::ofstream out(script);
    out << "#!/bin/sh\n"
        << "if [ \"$1\" = \"--version\" ]; then\n"
        << "  echo 'gpg (GnuPG) 2.4.4'\n"
        << "  echo 'Cipher: AES, AES256'\n"
        << "  echo 'Hash: SHA256'\n"
        << "  exit 0\n"
        << "fi\n"
        << "echo \"$@\" > '" << fpg::PathToUtf8String(dir.path() / "args") << "'\n"
        << "cat > '" << fpg::PathToUtf8String(dir.path() / "stdin") << "'\n"
        << "exit 0\n";
  }
  assert(::chmod(script.c_str(), 0700) == 0);

  fpg::tools::GpgEncryptor encryptor(fpg::PathToUtf8String(script));
  auto caps = encryptor.QueryCapabilities();
  assert(caps.has_value());
  assert(caps->version_line == "gpg (GnuPG) 2.4.4");
  assert(caps->SupportsCipher("AES256"));
  assert(caps->SupportsDigest("SHA256"));

  fpg::tools::EncryptRequest request;
  request.input = dir.path() / "in.zip";
  request.output = dir.path() / "in.zip.enc";
  request.passphrase = "Passphrase0123456789";
  request.cipher = "AES256";
  request.digest = "SHA256";
  auto result = encryptor.Encrypt(request);
  assert(result.Succeeded());

  const auto args = ReadText(dir.path() / "args");
  assert(Contains(args, "--batch --pinentry-mode loopback --passphrase-fd 0"));
  assert(Contains(args, "--digest-algo SHA256 --symmetric --cipher-algo AES256 --compress-level 0"));
  assert(Contains(args, "--output " + fpg::PathToUtf8String(request.output)));
  assert(!Contains(args, "Passphrase0123456789"));
  assert(ReadText(dir.path() / "stdin") == "Passphrase0123456789\n");
}

void TestGpgEncryptorFailure() {
  fpg::tools::GpgEncryptor missing("fpg-definitely-not-installed");
  assert(!missing.QueryCapabilities().has_value());
  fpg::tools::EncryptRequest request;
  request.input = "/nonexistent/in.zip";
  request.output = "/nonexistent/in.zip.enc";
  request.passphrase = "x";
  auto result = missing.Encrypt(request);
  assert(!result.Succeeded());
  assert(!result.diagnostic.empty());
}

void TestPosixFileOps() {
  fpg::testing::TempDir dir("file_ops");
  dir.Touch("a.zip", 1234);
  fpg::platform::PosixFileOps ops;
  assert(ops.FileSize(dir.path() / "a.zip") == 1234);
  assert(ops.FreeSpace(dir.path()) > 0);
  assert(ops.Exists(dir.path() / "a.zip"));
  ops.Rename(dir.path() / "a.zip", dir.path() / "b.zip");
  assert(!ops.Exists(dir.path() / "a.zip"));
  ops.Remove(dir.path() / "b.zip");
  assert(!ops.Exists(dir.path() / "b.zip"));

  bool threw = false;
  try {
    (void)ops.FileSize(dir.path() / "missing.zip");
  } catch (const fpg::Error& err) {
    threw = err.domain == fpg::ErrorDomain::IO && err.native_code.has_value();
  }
  assert(threw);
}

}  // namespace

int main() {
  TestPosixFileOps();
  if (!fpg::testing::ProgramAvailable("sh") || !fpg::testing::ProgramAvailable("cat")) {
    std::cout << "shell utilities not available, skipping\n";
    return 0;
  }
  TestCapturesStdout();
  TestStdinPayload();
  TestExitStatus();
  TestEnvironmentOverride();
  TestMissingProgram();
  TestGpgEncryptorArguments();
  TestGpgEncryptorFailure();
  std::cout << "process runner ok\n";
  return 0;
}
