#include "fpg/platform/process.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "fpg/error.h"

namespace fpg::platform {
namespace {

constexpr int kExecFailedStatus = 127;

class Pipe {
 public:
  Pipe() {
    if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
      throw Error(ErrorDomain::IO, errors::io::kPipeFailed, "Failed to create pipe", errno);
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_end() const noexcept { return fds_[0]; }
  int write_end() const noexcept { return fds_[1]; }
  void CloseRead() noexcept { Close(fds_[0]); }
  void CloseWrite() noexcept { Close(fds_[1]); }

 private:
  static void Close(int& fd) noexcept {
    if (fd >= 0) {
      (void)::close(fd);
      fd = -1;
    }
  }
  std::array<int, 2> fds_{-1, -1};
};

void WriteAll(int fd, std::string_view data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      // EPIPE: the child exited without draining stdin; its exit status reports it.
      return;
    }
    offset += static_cast<size_t>(written);
  }
}

std::string ReadAll(int fd) {
  std::string out;
  std::array<char, 4096> buffer{};
  for (;;) {
    ssize_t got = ::read(fd, buffer.data(), buffer.size());
    if (got < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (got == 0) {
      break;
    }
    out.append(buffer.data(), static_cast<size_t>(got));
  }
  return out;
}

int WaitForChild(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw Error(ErrorDomain::Dependency, errors::dependency::kSpawnFailed,
                  "Failed to wait for child process", errno);
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
  ProcessResult result;
  if (argv.empty()) {
    return result;
  }

  Pipe stdin_pipe;
  Pipe stdout_pipe;
  Pipe exec_pipe; // reports execvp failure back to the parent

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    throw Error(ErrorDomain::Dependency, errors::dependency::kSpawnFailed,
                "Failed to fork child process for " + argv.front(), errno);
  }

  if (pid == 0) {
    if (options.stdin_payload) {
      ::dup2(stdin_pipe.read_end(), STDIN_FILENO);
    }
    for (const auto& name : options.unset_environment) {
      ::unsetenv(name.c_str());
    }
    for (const auto& [name, value] : options.environment) {
      ::setenv(name.c_str(), value.c_str(), 1);
    }
    if (options.capture_stdout) {
      ::dup2(stdout_pipe.write_end(), STDOUT_FILENO);
      if (options.merge_stderr) {
        ::dup2(stdout_pipe.write_end(), STDERR_FILENO);
      }
    }
    ::execvp(args[0], args.data());
    int err = errno;
    (void)::write(exec_pipe.write_end(), &err, sizeof(err));
    ::_exit(kExecFailedStatus);
  }

  stdin_pipe.CloseRead();
  stdout_pipe.CloseWrite();
  exec_pipe.CloseWrite();

  if (options.stdin_payload) {
    WriteAll(stdin_pipe.write_end(), *options.stdin_payload);
  }
  stdin_pipe.CloseWrite();

  if (options.capture_stdout) {
    result.stdout_text = ReadAll(stdout_pipe.read_end());
  }
  stdout_pipe.CloseRead();

  int exec_errno = 0;
  ssize_t exec_report = 0;
  do {
    exec_report = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
  } while (exec_report < 0 && errno == EINTR);

  result.exit_code = WaitForChild(pid);
  result.launched = exec_report != static_cast<ssize_t>(sizeof(exec_errno));
  return result;
}

}  // namespace fpg::platform
