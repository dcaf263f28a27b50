#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "fpg/common.h"
#include "fpg/core/environment_validator.h"
#include "fpg/error.h"
#include "fpg/orchestrator/batch_config.h"
#include "fpg/orchestrator/batch_orchestrator.h"
#include "fpg/orchestrator/event_bus.h"
#include "fpg/platform/file_ops.h"
#include "fpg/tools/encryptor.h"
#include "fpg/tools/splitter.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitFailure = 1;

  void PrintUsage() {
    std::cerr << "File Privacy Guard " << fpg::kProgramVersion << "\n";
    std::cerr << "Usage:\n";
    std::cerr << "  " << fpg::kProgramName
              << "            Encrypt every supported file in the current directory\n";
    std::cerr << "  " << fpg::kProgramName << " --help     Show this text\n";
    std::cerr << "  " << fpg::kProgramName << " --version  Print the program version\n";
    std::cerr << "\nEnvironment:\n";
    std::cerr << "  FPG_GPG           gpg binary to run (default: gpg on PATH)\n";
    std::cerr << "  FPG_LOG_PATH      diagnostic log file\n";
    std::cerr << "                    (default: $XDG_STATE_HOME/fpg/fpg.log or\n";
    std::cerr << "                    ~/.local/state/fpg/fpg.log)\n";
    std::cerr << "  FPG_LOG_MAX_SIZE  rotate the log beyond this many bytes\n";
  }

  std::string_view DomainPrefix(fpg::ErrorDomain domain) {
    switch (domain) {
    case fpg::ErrorDomain::IO:
      return "I/O error";
    case fpg::ErrorDomain::Security:
      return "Security error";
    case fpg::ErrorDomain::Crypto:
      return "Cryptography error";
    case fpg::ErrorDomain::Validation:
      return "Validation error";
    case fpg::ErrorDomain::Config:
      return "Configuration error";
    case fpg::ErrorDomain::Dependency:
      return "Dependency error";
    case fpg::ErrorDomain::State:
      return "State error";
    case fpg::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const fpg::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    std::vector<fpg::orchestrator::EventField> fields;
    fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    fields.emplace_back("code", std::to_string(err.code),
                        fpg::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      fields.emplace_back("native_code", std::to_string(*err.native_code),
                          fpg::orchestrator::FieldPrivacy::kPublic, true);
    }
    // The message may carry file names, so only its digest reaches the log.
    fields.emplace_back("detail", err.what(), fpg::orchestrator::FieldPrivacy::kHash);
    fpg::orchestrator::PublishEvent(fpg::orchestrator::EventSeverity::kError,
                                    fpg::orchestrator::EventCategory::kDiagnostics, "cli_error",
                                    std::string(DomainPrefix(err.domain)), std::move(fields));
  }

  void InstallLogger() {
    auto logger = std::make_shared<fpg::orchestrator::JsonLineLogger>();
    fpg::orchestrator::EventBus::Instance().Subscribe(
        [logger](const fpg::orchestrator::Event& event) { logger->Log(event); });
  }

  int RunBatch() {
    std::error_code ec;
    auto directory = std::filesystem::current_path(ec);
    if (ec) {
      throw fpg::Error{fpg::ErrorDomain::IO, fpg::errors::io::kDirectoryListFailed,
                       "Cannot resolve working directory: " + ec.message(), ec.value()};
    }

    fpg::tools::GpgEncryptor encryptor;
    fpg::tools::CoreutilsSplitter splitter;
    fpg::platform::PosixFileOps file_ops;
    fpg::orchestrator::BatchOrchestrator orchestrator(
        fpg::orchestrator::DefaultBatchConfig(),
        fpg::orchestrator::BatchBackends{encryptor, splitter, file_ops}, directory,
        fpg::core::CurrentPlatform(), std::cin, std::cout);

    const auto outcome = orchestrator.Run();
    std::cout.flush();
    return outcome == fpg::orchestrator::RunOutcome::kCompleted ? kExitOk : kExitFailure;
  }

} // namespace

int main(int argc, char** argv) {
  // A tool that exits before draining its stdin must not take fpg down with it.
  std::signal(SIGPIPE, SIG_IGN);

  try {
    if (argc > 2) {
      PrintUsage();
      return kExitFailure;
    }
    if (argc == 2) {
      std::string_view arg = argv[1];
      if (arg == "-h" || arg == "--help") {
        PrintUsage();
        return kExitOk;
      }
      if (arg == "--version") {
        std::cout << fpg::kProgramName << ' ' << fpg::kProgramVersion << '\n';
        return kExitOk;
      }
      PrintUsage();
      return kExitFailure;
    }

    InstallLogger();
    return RunBatch();
  } catch (const fpg::Error& err) {
    ReportError(err);
    return kExitFailure;
  } catch (const std::exception& err) {
    std::cerr << "Error: " << err.what() << std::endl;
    return kExitFailure;
  }
}
