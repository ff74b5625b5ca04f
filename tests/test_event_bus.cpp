#include "xk/diagnostics/event_bus.h"
#include "xk/key/cpu_key.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using xk::diagnostics::Event;
using xk::diagnostics::EventCategory;
using xk::diagnostics::EventSeverity;
using xk::diagnostics::FieldPrivacy;

void TestFormatting() {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = "unit.test";
  event.message = "quote \" and\nnewline";
  event.fields.emplace_back("count", "7", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("input", "secret", FieldPrivacy::kHash);

  auto json = xk::diagnostics::FormatEventJson(event, std::chrono::system_clock::time_point{});
  assert(json.front() == '{' && json.back() == '}');
  assert(json.find("\"ts\":\"1970-01-01T00:00:00.000000Z\"") != std::string::npos);
  assert(json.find("\"severity\":\"warning\"") != std::string::npos);
  assert(json.find("\"category\":\"security\"") != std::string::npos);
  assert(json.find("\"event_id\":\"unit.test\"") != std::string::npos);
  assert(json.find("quote \\\" and\\nnewline") != std::string::npos);
  assert(json.find("\"count\":7") != std::string::npos);
  assert(json.find("\"secret\":\"[REDACTED]\"") != std::string::npos);
  assert(json.find("hunter2") == std::string::npos);
  assert(json.find("\"input\":\"hash:"
                   "2bb80d537b1da3e38bd30361aa855686bde0eacd7162fef6a25fe97bf527a25b\"") !=
         std::string::npos);
  assert(xk::diagnostics::HashForTelemetry("").empty());
}

void TestSeverityNames() {
  assert(xk::diagnostics::ParseSeverity("debug") == EventSeverity::kDebug);
  assert(xk::diagnostics::ParseSeverity("critical") == EventSeverity::kCritical);
  assert(!xk::diagnostics::ParseSeverity("DEBUG"));
  assert(!xk::diagnostics::ParseSeverity(""));
}

void TestLoggerFilters() {
  std::ostringstream sink;
  xk::diagnostics::JsonLineLogger logger(sink, EventSeverity::kWarning);
  assert(!logger.Accepts(EventSeverity::kInfo));
  assert(logger.Accepts(EventSeverity::kError));

  Event quiet;
  quiet.severity = EventSeverity::kDebug;
  quiet.event_id = "quiet";
  logger.Log(quiet);
  assert(sink.str().empty());

  Event loud;
  loud.severity = EventSeverity::kError;
  loud.event_id = "loud";
  logger.Log(loud);
  auto text = sink.str();
  assert(text.find("\"event_id\":\"loud\"") != std::string::npos);
  assert(text.back() == '\n');
}

void TestRejectionEvent() {
  auto& bus = xk::diagnostics::EventBus::Instance();
  assert(!bus.HasSubscribers());

  std::ostringstream sink;
  auto logger = std::make_shared<xk::diagnostics::JsonLineLogger>(sink, EventSeverity::kDebug);
  xk::diagnostics::AttachLogger(logger);

  std::vector<Event> events;
  bus.Subscribe([&](const Event& event) { events.push_back(event); });
  assert(bus.HasSubscribers());

  constexpr const char* kBadKey = "C0DE8DAAE05493BCB0F1664FB1751F0F";
  bool threw = false;
  try {
    (void)xk::key::CpuKey::Parse(kBadKey);
  } catch (const xk::KeyError& err) {
    threw = true;
    assert(err.kind == xk::KeyErrorKind::kEcd);
  }
  assert(threw);

  assert(events.size() == 1);
  const auto& event = events.front();
  assert(event.event_id == "key.parse.rejected");
  assert(event.category == EventCategory::kSecurity);
  bool saw_input = false;
  for (const auto& field : event.fields) {
    if (field.key == "input") {
      saw_input = true;
      assert(field.privacy == FieldPrivacy::kHash);
    }
    if (field.key == "kind") {
      assert(field.value == "ecd");
    }
  }
  assert(saw_input);

  auto line = sink.str();
  assert(line.find("key.parse.rejected") != std::string::npos);
  assert(line.find(kBadKey) == std::string::npos && "raw key text never reaches the log");
  assert(line.find("hash:" + xk::diagnostics::HashForTelemetry(kBadKey)) != std::string::npos);

  // Non-throwing paths stay silent.
  std::optional<xk::key::CpuKey> out;
  assert(!xk::key::CpuKey::TryParse(kBadKey, out));
  assert(events.size() == 1);

  xk::diagnostics::ResetEventBusForTesting();
  assert(!bus.HasSubscribers());
}

void TestFailingSubscriberKeepsKeyError() {
  auto& bus = xk::diagnostics::EventBus::Instance();
  bus.Subscribe([](const Event&) { throw std::runtime_error("sink failed"); });

  bool threw_key_error = false;
  try {
    (void)xk::key::CpuKey::Parse("C0DE8DAAE05493BCB0F1664FB1751F0F");
  } catch (const xk::KeyError& err) {
    threw_key_error = true;
    assert(err.kind == xk::KeyErrorKind::kEcd && "a broken log sink must not change the diagnosis");
  } catch (const std::exception&) {
    assert(false && "subscriber failure escaped in place of KeyError");
  }
  assert(threw_key_error);

  bool threw_shape = false;
  try {
    (void)xk::key::CpuKey::Parse("C0DE");
  } catch (const xk::KeyError& err) {
    threw_shape = err.kind == xk::KeyErrorKind::kShape;
  }
  assert(threw_shape);

  xk::diagnostics::ResetEventBusForTesting();
}

} // namespace

int main() {
  TestFormatting();
  TestSeverityNames();
  TestLoggerFilters();
  TestRejectionEvent();
  TestFailingSubscriberKeepsKeyError();
  std::cout << "event bus ok\n";
  return 0;
}
