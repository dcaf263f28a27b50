#pragma once

#include <cstdint>
#include <filesystem>

namespace fpg::platform {

// Filesystem capabilities the batch pipeline depends on. Every failure is
// reported by throwing fpg::Error (IO domain) with the native errno attached.
class FileOps {
public:
  virtual ~FileOps() = default;

  virtual std::uint64_t FileSize(const std::filesystem::path& path) = 0;
  // Bytes available to an unprivileged user (block size x available blocks).
  virtual std::uint64_t FreeSpace(const std::filesystem::path& directory) = 0;
  virtual bool Exists(const std::filesystem::path& path) = 0;
  virtual void Rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
  virtual void Remove(const std::filesystem::path& path) = 0;
};

class PosixFileOps : public FileOps {
public:
  std::uint64_t FileSize(const std::filesystem::path& path) override;
  std::uint64_t FreeSpace(const std::filesystem::path& directory) override;
  bool Exists(const std::filesystem::path& path) override;
  void Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
  void Remove(const std::filesystem::path& path) override;
};

}  // namespace fpg::platform
