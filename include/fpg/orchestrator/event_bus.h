#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fpg::orchestrator {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  std::string HashForTelemetry(std::string_view input);

  // Serializes |event| as a single JSON object, applying field privacy.
  std::string BuildEventJson(const Event& event, const std::string& timestamp);

  class JsonLineLogger {
  public:
    // An empty |path| resolves FPG_LOG_PATH, then $XDG_STATE_HOME/fpg/fpg.log,
    // then $HOME/.local/state/fpg/fpg.log. The file is created on first write.
    explicit JsonLineLogger(std::filesystem::path path = {});
    void Log(const Event& event);

    const std::filesystem::path& Path() const noexcept { return log_path_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    bool EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    static std::filesystem::path ResolveLogPath();
    static size_t ResolveMaxBytes();
    void ReportFailureOnce(std::string_view what);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    bool failure_reported_{false};
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    EventBus() = default;

  private:
    std::mutex subscribers_mutex_;
    std::vector<Subscriber> subscribers_;
  };

  // Publishes a lifecycle/diagnostic event without letting subscriber failures
  // escape into the pipeline.
  void PublishEvent(EventSeverity severity, EventCategory category, std::string event_id,
                    std::string message, std::vector<EventField> fields = {});

  void ResetEventBusForTesting();

} // namespace fpg::orchestrator
