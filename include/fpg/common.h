#pragma once
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>

namespace fpg {

inline constexpr std::uint64_t kBytesPerMegabyte = 1048576;

// Sizes and speeds are reported with two decimals throughout the tool.
inline double RoundTo2(double value) noexcept {
  return std::round(value * 100.0) / 100.0;
}

inline double BytesToMegabytes(std::uint64_t bytes) noexcept {
  return static_cast<double>(bytes) / static_cast<double>(kBytesPerMegabyte);
}

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

// Formats a two-decimal figure the way it is printed to the operator:
// trailing zeros dropped but at least one decimal kept ("12.5", "3.0").
inline std::string FormatTwoDecimals(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", RoundTo2(value));
  std::string text(buffer);
  while (text.size() > 1 && text.back() == '0' && text[text.size() - 2] != '.') {
    text.pop_back();
  }
  return text;
}

inline constexpr std::string_view kProgramName = "fpg";
inline constexpr std::string_view kProgramVersion = "0.2.0";

} // namespace fpg
