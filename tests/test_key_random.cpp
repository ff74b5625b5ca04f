#include "xk/config.h"
#include "xk/diagnostics/event_bus.h"
#include "xk/error.h"
#include "xk/key/cpu_key.h"
#include "xk/key/validator.h"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void TestSystemRandom() {
  std::set<xk::key::CpuKey> seen;
  for (int i = 0; i < 100; ++i) {
    auto key = xk::key::CpuKey::CreateRandom();
    assert(key.IsValid());
    assert(!key.IsEmpty());
    assert(xk::key::HammingWeightOk(key.AsSpan()));
    assert(xk::key::EcdOk(key.AsSpan()));
    assert(xk::key::CpuKey::Parse(key.ToString()) == key && "generated keys round-trip through text");
    seen.insert(key);
  }
  assert(seen.size() == 100 && "generated keys are distinct");
}

void TestRejectionSampling() {
  // Feeds two unusable draws (all zero, then all ones) before a known key.
  const auto target = xk::key::CpuKey::Parse("C0DE8DAAE05493BCB0F1664FB1751F00");
  int calls = 0;
  auto source = [&](std::span<std::uint8_t> out) {
    ++calls;
    if (calls == 1) {
      std::fill(out.begin(), out.end(), std::uint8_t{0});
    } else if (calls == 2) {
      std::fill(out.begin(), out.end(), std::uint8_t{0xFF});
    } else {
      auto bytes = target.ToArray();
      // Garbage in the check field is overwritten by the seal.
      bytes[15] ^= 0xF0;
      std::copy(bytes.begin(), bytes.end(), out.begin());
    }
  };

  std::vector<std::string> events;
  xk::diagnostics::EventBus::Instance().Subscribe(
      [&](const xk::diagnostics::Event& event) { events.push_back(event.event_id); });

  auto key = xk::key::CpuKey::CreateRandom(source);
  assert(calls == 3);
  assert(key == target);
  assert(events.size() == 1 && events.front() == "key.random.generated");

  xk::diagnostics::ResetEventBusForTesting();
}

void TestAttemptLimit() {
  xk::config::RuntimeConfig config{};
  config.random_max_attempts = 8;
  xk::config::SetForTesting(config);

  int calls = 0;
  auto zeros = [&](std::span<std::uint8_t> out) {
    ++calls;
    std::fill(out.begin(), out.end(), std::uint8_t{0});
  };

  std::vector<std::string> events;
  xk::diagnostics::EventBus::Instance().Subscribe(
      [&](const xk::diagnostics::Event& event) { events.push_back(event.event_id); });

  bool threw = false;
  try {
    (void)xk::key::CpuKey::CreateRandom(zeros);
  } catch (const xk::Error& err) {
    threw = true;
    assert(err.domain == xk::ErrorDomain::Internal);
    assert(err.code == xk::errors::internal::kRandomAttemptsExhausted);
  }
  assert(threw);
  assert(calls == 8);
  assert(events.size() == 1 && events.front() == "key.random.exhausted");

  xk::diagnostics::ResetEventBusForTesting();
  xk::config::ResetForTesting();
}

void TestFailingSubscriber() {
  xk::diagnostics::EventBus::Instance().Subscribe(
      [](const xk::diagnostics::Event&) { throw std::runtime_error("sink failed"); });

  auto key = xk::key::CpuKey::CreateRandom();
  assert(key.IsValid() && "a broken log sink must not lose the generated key");

  xk::config::RuntimeConfig config{};
  config.random_max_attempts = 2;
  xk::config::SetForTesting(config);
  bool internal = false;
  try {
    (void)xk::key::CpuKey::CreateRandom(
        [](std::span<std::uint8_t> out) { std::fill(out.begin(), out.end(), std::uint8_t{0}); });
  } catch (const xk::Error& err) {
    internal = err.code == xk::errors::internal::kRandomAttemptsExhausted;
  }
  assert(internal);

  xk::diagnostics::ResetEventBusForTesting();
  xk::config::ResetForTesting();
}

} // namespace

int main() {
  TestSystemRandom();
  TestRejectionSampling();
  TestAttemptLimit();
  TestFailingSubscriber();
  std::cout << "random key ok\n";
  return 0;
}
