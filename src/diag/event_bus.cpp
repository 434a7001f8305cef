#include "fsn/diag/event_bus.h"

#include <algorithm>
#include <atomic>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>
#include <system_error>
#include <utility>

#include "fsn/crypto/digest.h"

namespace fsn::diag {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr const char* kLogFileName = "fsnode.log";

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
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kTraversal:
    return "traversal";
  case EventCategory::kCapability:
    return "capability";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
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

bool BelowThreshold(EventSeverity severity, LogLevel min_level) {
  return static_cast<int>(severity) < static_cast<int>(min_level);
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return {};
  }
  auto digest = crypto::DigestBytes(
      crypto::DigestAlgorithm::kSha256,
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(input.data()), input.size()));
  return crypto::HexEncode(digest);
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"");
  payload.append(FormatTimestamp(tp));
  payload.append("\",\"severity\":\"");
  payload.append(SeverityToString(event.severity));
  payload.append("\",\"category\":\"");
  payload.append(CategoryToString(event.category));
  payload.push_back('"');
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"");
    payload.append(EscapeJson(event.event_id));
    payload.push_back('"');
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"");
    payload.append(EscapeJson(event.message));
    payload.push_back('"');
  }
  for (const auto& field : event.fields) {
    payload.append(",\"");
    payload.append(EscapeJson(field.key));
    payload.append("\":");
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = "hash:" + HashForTelemetry(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.push_back('"');
      payload.append(EscapeJson(sanitized));
      payload.push_back('"');
    }
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger(LoggerSettings settings)
    : settings_(std::move(settings)), log_path_(settings_.directory / kLogFileName) {}

void JsonLineLogger::EnsureOpenLocked() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      disabled_ = true;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        disabled_ = true;
        return;
      }
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeededLocked(size_t incoming_bytes) {
  std::error_code ec;
  if (!std::filesystem::exists(log_path_, ec)) {
    return;
  }
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"log size query failed\",\"error_code\":"
              << ec.value() << "}" << std::endl;
    return;
  }
  if (current_size + incoming_bytes <= settings_.max_bytes) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = settings_.max_files; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst = std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec || !source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
  if (settings_.max_files == 0) {
    std::filesystem::remove(log_path_, ec);
  }
}

void JsonLineLogger::Log(const Event& event) {
  if (BelowThreshold(event.severity, settings_.min_level)) {
    return;
  }
  std::lock_guard<std::mutex> guard(mutex_);
  if (disabled_) {
    return;
  }
  auto line = FormatEventJson(event, std::chrono::system_clock::now());
  RotateIfNeededLocked(line.size() + 1);
  EnsureOpenLocked();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  Subscribe([](const Event& event) { DefaultJsonLogger().Log(event); });
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      // Sink failures never reach the publisher.
      std::clog << "{\"event\":\"subscriber_error\",\"message\":\"" << EscapeJson(ex.what()) << "\"}"
                << std::endl;
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void EventBus::ClearSubscribers() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

void Emit(EventCategory category, EventSeverity severity, std::string event_id,
          std::string message, std::vector<EventField> fields) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

} // namespace fsn::diag
