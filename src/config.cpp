#include "xk/config.h"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <utility>

namespace xk::config {
namespace {

std::size_t ParseRandomMaxAttempts(const char* raw) {
  if (!raw || *raw == '\0') {
    return kDefaultRandomMaxAttempts;
  }
  const char* end = raw + std::strlen(raw);
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(raw, end, value);
  if (ec != std::errc() || ptr != end || value == 0 || value > kRandomMaxAttemptsLimit) {
    return kDefaultRandomMaxAttempts;
  }
  return static_cast<std::size_t>(value);
}

struct ConfigState {
  std::mutex mutex;
  std::optional<RuntimeConfig> config;
};

ConfigState& State() {
  static ConfigState state;
  return state;
}

}  // namespace

RuntimeConfig LoadFromEnvironment(const EnvLookup& lookup) {
  auto get = [&lookup](const char* name) -> const char* {
    return lookup ? lookup(name) : std::getenv(name);
  };

  RuntimeConfig config{};
  config.random_max_attempts = ParseRandomMaxAttempts(get(kEnvRandomMaxAttempts));
  if (const char* level = get(kEnvLogLevel); level && *level) {
    if (auto parsed = diagnostics::ParseSeverity(level)) {
      config.log_level = *parsed;
    }
  }
  if (const char* file = get(kEnvLogFile); file && *file) {
    config.log_file = std::filesystem::path(file);
  }
  return config;
}

RuntimeConfig Current() {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (!state.config) {
    state.config = LoadFromEnvironment();
  }
  return *state.config;
}

void SetForTesting(RuntimeConfig config) {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.config = std::move(config);
}

void ResetForTesting() {
  auto& state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.config.reset();
}

}  // namespace xk::config
