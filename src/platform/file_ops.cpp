#include "fpg/platform/file_ops.h"

#include <cerrno>
#include <string>
#include <system_error>

#include <sys/stat.h>
#include <sys/statvfs.h>

#include "fpg/common.h"
#include "fpg/error.h"

namespace fpg::platform {

std::uint64_t PosixFileOps::FileSize(const std::filesystem::path& path) {
  struct stat info {
  };
  if (::stat(path.c_str(), &info) != 0) {
    throw Error{ErrorDomain::IO, errors::io::kStatFailed,
                "Failed to stat " + PathToUtf8String(path) + ": " + std::generic_category().message(errno),
                errno};
  }
  return static_cast<std::uint64_t>(info.st_size);
}

std::uint64_t PosixFileOps::FreeSpace(const std::filesystem::path& directory) {
  struct statvfs info {
  };
  if (::statvfs(directory.c_str(), &info) != 0) {
    throw Error{ErrorDomain::IO, errors::io::kFreeSpaceQueryFailed,
                "Failed to query free space of " + PathToUtf8String(directory) + ": " +
                    std::generic_category().message(errno),
                errno};
  }
  return static_cast<std::uint64_t>(info.f_bsize) * static_cast<std::uint64_t>(info.f_bavail);
}

bool PosixFileOps::Exists(const std::filesystem::path& path) {
  std::error_code ec;
  const bool exists = std::filesystem::exists(std::filesystem::symlink_status(path, ec));
  if (ec && ec != std::errc::no_such_file_or_directory) {
    throw Error{ErrorDomain::IO, errors::io::kStatFailed,
                "Failed to inspect " + PathToUtf8String(path) + ": " + ec.message(), ec.value()};
  }
  return exists;
}

void PosixFileOps::Rename(const std::filesystem::path& from, const std::filesystem::path& to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kRenameFailed,
                "Failed to rename " + PathToUtf8String(from) + " to " + PathToUtf8String(to) +
                    ": " + ec.message(),
                ec.value()};
  }
}

void PosixFileOps::Remove(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::remove(path, ec) || ec) {
    const int native = ec ? ec.value() : ENOENT;
    throw Error{ErrorDomain::IO, errors::io::kRemoveFailed,
                "Failed to remove " + PathToUtf8String(path) + ": " +
                    std::generic_category().message(native),
                native};
  }
}

}  // namespace fpg::platform
