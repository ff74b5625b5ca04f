#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xk::diagnostics {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kSecurity, kDiagnostics };

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

  // SHA-256 of `input` as lowercase hex; empty input yields an empty string.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);
  std::optional<EventSeverity> ParseSeverity(std::string_view text);

  // One JSON object, no trailing newline. Redacted and hashed fields never
  // carry their original value.
  std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp);

  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::ostream& sink,
                            EventSeverity min_severity = EventSeverity::kWarning);
    JsonLineLogger(const std::filesystem::path& path, EventSeverity min_severity);

    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    void Log(const Event& event);
    bool Accepts(EventSeverity severity) const noexcept { return severity >= min_severity_; }

  private:
    std::mutex mutex_;
    std::ofstream file_;
    std::ostream* sink_{nullptr};
    EventSeverity min_severity_;
  };

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    EventBus() = default;
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    // Lets publishers skip building events nobody will see.
    bool HasSubscribers() const;

  private:
    friend void ResetEventBusForTesting();

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Subscribes `logger` to the process bus. The bus shares ownership.
  void AttachLogger(const std::shared_ptr<JsonLineLogger>& logger);

  void ResetEventBusForTesting(); // test-only teardown

} // namespace xk::diagnostics
