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

#include "fsn/config.h"

namespace fsn::diag {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kLifecycle, kTraversal, kCapability, kDiagnostics };

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

  // SHA-256 hex of input, empty for empty input.
  std::string HashForTelemetry(std::string_view input);

  // Renders one event as a single JSON object (no trailing newline).
  std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp);

  class JsonLineLogger {
  public:
    explicit JsonLineLogger(LoggerSettings settings = LoggerSettings::FromEnvironment());
    void Log(const Event& event);

    [[nodiscard]] const std::filesystem::path& LogPath() const noexcept { return log_path_; }

  private:
    void EnsureOpenLocked();
    void RotateIfNeededLocked(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    LoggerSettings settings_;
    std::filesystem::path log_path_;
    bool disabled_{false};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers synchronously to every subscriber on the calling thread.
    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    // Drops every subscriber, including the default JSON logger.
    void ClearSubscribers();

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Publishes with less ceremony at call sites inside the library.
  void Emit(EventCategory category, EventSeverity severity, std::string event_id,
            std::string message, std::vector<EventField> fields = {});

  void ResetEventBusForTesting();

} // namespace fsn::diag
