#include "xk/diagnostics/event_bus.h"

#include <atomic>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>
#include <utility>

#include "xk/codec/hex.h"
#include "xk/crypto/digest.h"
#include "xk/error.h"

namespace xk::diagnostics {
namespace {

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

std::string HashTag(std::string_view value) {
  return std::string{"hash:"} + HashForTelemetry(value);
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  const auto* data = reinterpret_cast<const uint8_t*>(input.data());
  auto digest = xk::crypto::SHA256_Hash(std::span<const uint8_t>(data, input.size()));
  return xk::codec::EncodeDigestHex(digest);
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
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::optional<EventSeverity> ParseSeverity(std::string_view text) {
  for (auto severity : {EventSeverity::kDebug, EventSeverity::kInfo, EventSeverity::kWarning,
                        EventSeverity::kError, EventSeverity::kCritical}) {
    if (text == SeverityToString(severity)) {
      return severity;
    }
  }
  return std::nullopt;
}

std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp) {
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += FormatTimestamp(tp);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(std::ostream& sink, EventSeverity min_severity)
    : sink_(&sink), min_severity_(min_severity) {}

JsonLineLogger::JsonLineLogger(const std::filesystem::path& path, EventSeverity min_severity)
    : min_severity_(min_severity) {
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_.is_open()) {
    throw Error{ErrorDomain::IO, errors::io::kLogOpenFailed,
                "Failed to open log file " + path.string()};
  }
  sink_ = &file_;
}

void JsonLineLogger::Log(const Event& event) {
  if (!Accepts(event.severity)) {
    return;
  }
  auto line = FormatEventJson(event, std::chrono::system_clock::now());
  std::lock_guard<std::mutex> guard(mutex_);
  *sink_ << line << '\n';
  sink_->flush();
}

EventBus& EventBus::Instance() {
  static EventBus bus;
  return bus;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;  // subscribers publishing would deadlock
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
    if (subscriber) {
      subscriber(event);
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

bool EventBus::HasSubscribers() const {
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  return current && !current->empty();
}

void AttachLogger(const std::shared_ptr<JsonLineLogger>& logger) {
  EventBus::Instance().Subscribe([logger](const Event& event) { logger->Log(event); });
}

void ResetEventBusForTesting() {
  auto& bus = EventBus::Instance();
  std::lock_guard<std::mutex> guard(bus.subscribers_mutex_);
  std::atomic_store_explicit(&bus.subscribers_snapshot_, std::shared_ptr<const EventBus::SubscriberList>{},
                             std::memory_order_release);
}

} // namespace xk::diagnostics
