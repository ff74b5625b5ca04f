#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>

#include "xk/diagnostics/event_bus.h"

namespace xk::config {

inline constexpr std::size_t kDefaultRandomMaxAttempts = 4096;
inline constexpr std::size_t kRandomMaxAttemptsLimit = 1'000'000;

inline constexpr const char* kEnvRandomMaxAttempts = "XK_RANDOM_MAX_ATTEMPTS";
inline constexpr const char* kEnvLogLevel = "XK_LOG_LEVEL";
inline constexpr const char* kEnvLogFile = "XK_LOG_FILE";

struct RuntimeConfig {
  // Cap on rejection-sampling rounds in CpuKey::CreateRandom.
  std::size_t random_max_attempts{kDefaultRandomMaxAttempts};
  diagnostics::EventSeverity log_level{diagnostics::EventSeverity::kWarning};
  std::optional<std::filesystem::path> log_file;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// Unset or unparsable variables keep their defaults.
RuntimeConfig LoadFromEnvironment(const EnvLookup& lookup = {});

// Process-wide configuration, loaded from the environment on first use.
RuntimeConfig Current();

void SetForTesting(RuntimeConfig config);
void ResetForTesting();

}  // namespace xk::config
