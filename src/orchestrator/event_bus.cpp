#include "fpg/orchestrator/event_bus.h"

#include "fpg/common.h"
#include "fpg/crypto/sha256.h"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fpg::orchestrator {
namespace {

constexpr size_t kDefaultMaxLogBytes = 10 * 1024 * 1024; // 10 MiB
constexpr std::string_view kDefaultLogDirectory = "fpg";
constexpr std::string_view kDefaultLogFile = "fpg.log";

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& EventBusSingleton() {
  static std::unique_ptr<EventBus> instance;
  return instance;
}

struct PublishReentrancyGuard { // suppress recursive publish deadlocks
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string HashTag(std::string_view value) {
  auto digest = HashForTelemetry(value);
  if (digest.empty()) {
    return std::string{"hash:"};
  }
  return std::string{"hash:"} + digest;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  return crypto::SHA256_Hex(input);
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    payload.append(",\"").append(EscapeJson(field.key)).append("\":");
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.append("\"").append(EscapeJson(sanitized)).append("\"");
    }
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path path)
    : log_path_(path.empty() ? ResolveLogPath() : std::move(path)),
      max_bytes_(ResolveMaxBytes()) {}

std::filesystem::path JsonLineLogger::ResolveLogPath() {
  const char* env = std::getenv("FPG_LOG_PATH");
  if (env && *env != '\0') {
    return std::filesystem::path(env);
  }
  // Never under the working directory: that is the payload being encrypted.
  const char* state_home = std::getenv("XDG_STATE_HOME");
  if (state_home && *state_home != '\0' && std::filesystem::path(state_home).is_absolute()) {
    return std::filesystem::path(state_home) / kDefaultLogDirectory / kDefaultLogFile;
  }
  const char* home = std::getenv("HOME");
  if (home && *home != '\0') {
    return std::filesystem::path(home) / ".local" / "state" / kDefaultLogDirectory /
           kDefaultLogFile;
  }
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    temp = "/tmp";
  }
  return temp / kDefaultLogDirectory / kDefaultLogFile;
}

size_t JsonLineLogger::ResolveMaxBytes() {
  const char* env = std::getenv("FPG_LOG_MAX_SIZE");
  if (!env || *env == '\0') {
    return kDefaultMaxLogBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + std::strlen(env), value);
  if (ec != std::errc() || ptr != env + std::strlen(env) || value == 0) {
    return kDefaultMaxLogBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::ReportFailureOnce(std::string_view what) {
  if (failure_reported_) {
    return;
  }
  failure_reported_ = true;
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << EscapeJson(what) << "\"}"
            << std::endl;
}

bool JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return true;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportFailureOnce("failed to create log directory " + PathToUtf8String(parent) + ": " +
                        ec.message());
      return false;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    ReportFailureOnce("failed to open log file " + PathToUtf8String(log_path_));
    return false;
  }
  return true;
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    return; // nothing to rotate yet
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    auto src = idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    auto dst = std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    if (!std::filesystem::exists(src, ec)) {
      continue;
    }
    std::filesystem::remove(dst, ec);
    std::filesystem::rename(src, dst, ec);
    if (ec) {
      ReportFailureOnce("failed to rotate log file: " + ec.message());
      return;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto line = BuildEventJson(event, FormatTimestamp(std::chrono::system_clock::now()));
  RotateIfNeeded(line.size() + 1);
  if (!EnsureOpen()) {
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    ReportFailureOnce("failed to write log entry");
  }
}

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  auto& instance = EventBusSingleton();
  if (!instance) {
    instance = std::make_unique<EventBus>();
  }
  return *instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard reentrancy(in_publish);
  std::vector<Subscriber> targets;
  {
    std::lock_guard<std::mutex> guard(subscribers_mutex_);
    targets = subscribers_;
  }
  for (const auto& subscriber : targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  subscribers_.push_back(std::move(fn));
}

void PublishEvent(EventSeverity severity, EventCategory category, std::string event_id,
                  std::string message, std::vector<EventField> fields) {
  Event event;
  event.severity = severity;
  event.category = category;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  try {
    EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) { // diagnostics never terminate the pipeline
    std::clog << "{\"event\":\"eventbus_error\",\"message\":\"publish failed\",\"detail\":\""
              << EscapeJson(ex.what()) << "\"}" << std::endl;
  }
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  EventBusSingleton().reset();
}

} // namespace fpg::orchestrator
