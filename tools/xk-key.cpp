#include <array>
#include <charconv>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "xk/codec/hex.h"
#include "xk/config.h"
#include "xk/diagnostics/event_bus.h"
#include "xk/error.h"
#include "xk/key/cpu_key.h"
#include "xk/key/validator.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;
constexpr std::size_t kMaxGenerateCount = 100000;

void PrintUsage() {
  std::cout << "Usage:\n"
            << "  xk-key check <hex>...\n"
            << "  xk-key generate [--count=<n>]\n"
            << "  xk-key digest <hex>\n"
            << "  xk-key seal <hex>\n"
            << "\n"
            << "Environment: XK_LOG_LEVEL, XK_LOG_FILE, XK_RANDOM_MAX_ATTEMPTS\n";
}

void ConfigureLogging(const xk::config::RuntimeConfig& config) {
  std::shared_ptr<xk::diagnostics::JsonLineLogger> logger;
  if (config.log_file) {
    logger = std::make_shared<xk::diagnostics::JsonLineLogger>(*config.log_file, config.log_level);
  } else {
    logger = std::make_shared<xk::diagnostics::JsonLineLogger>(std::clog, config.log_level);
  }
  xk::diagnostics::AttachLogger(logger);
}

std::optional<std::size_t> ParseCount(std::string_view arg) {
  constexpr std::string_view kPrefix{"--count="};
  if (arg.substr(0, kPrefix.size()) != kPrefix) {
    return std::nullopt;
  }
  auto digits = arg.substr(kPrefix.size());
  std::size_t value = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
  if (ec != std::errc() || ptr != digits.data() + digits.size() || value == 0 ||
      value > kMaxGenerateCount) {
    return std::nullopt;
  }
  return value;
}

int RunCheck(const std::vector<std::string_view>& keys) {
  if (keys.empty()) {
    PrintUsage();
    return kExitUsage;
  }
  int status = kExitOk;
  for (auto text : keys) {
    if (auto kind = xk::key::CpuKey::Check(text)) {
      std::cout << text << ": " << xk::KeyErrorKindName(*kind) << "\n";
      status = kExitFailure;
    } else {
      std::cout << text << ": OK\n";
    }
  }
  return status;
}

int RunGenerate(const std::vector<std::string_view>& args) {
  std::size_t count = 1;
  if (args.size() > 1) {
    PrintUsage();
    return kExitUsage;
  }
  if (args.size() == 1) {
    auto parsed = ParseCount(args.front());
    if (!parsed) {
      std::cerr << "Invalid --count (expected 1.." << kMaxGenerateCount << ")\n";
      return kExitUsage;
    }
    count = *parsed;
  }
  for (std::size_t i = 0; i < count; ++i) {
    std::cout << xk::key::CpuKey::CreateRandom() << "\n";
  }
  return kExitOk;
}

int RunDigest(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    PrintUsage();
    return kExitUsage;
  }
  const auto key = xk::key::CpuKey::Parse(args.front());
  const auto digest = key.GetDigest();
  std::cout << xk::codec::EncodeDigestHex(digest) << "\n";
  return kExitOk;
}

// Recomputes the ECD field of well-formed input; the Hamming weight is
// reported but not repaired.
int RunSeal(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    PrintUsage();
    return kExitUsage;
  }
  xk::codec::KeyBytes bytes{};
  if (auto kind = xk::codec::DecodeHex(args.front(), bytes)) {
    std::cerr << args.front() << ": " << xk::codec::DescribeTextFailure(args.front(), *kind)
              << "\n";
    return kExitFailure;
  }
  xk::key::ComputeEcd(bytes);
  std::array<char, xk::key::CpuKey::kTextSize> text{};
  xk::codec::EncodeHexTo(bytes, text);
  const unsigned weight = xk::key::HammingWeight(bytes);
  std::cout << std::string_view(text.data(), text.size()) << " hamming_weight=" << weight
            << (weight == xk::key::kRequiredHammingWeight ? " ok" : " mismatch") << "\n";
  return weight == xk::key::kRequiredHammingWeight ? kExitOk : kExitFailure;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return kExitUsage;
  }
  const std::string_view command{argv[1]};
  std::vector<std::string_view> args;
  for (int i = 2; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  try {
    ConfigureLogging(xk::config::Current());
    if (command == "check") {
      return RunCheck(args);
    }
    if (command == "generate") {
      return RunGenerate(args);
    }
    if (command == "digest") {
      return RunDigest(args);
    }
    if (command == "seal") {
      return RunSeal(args);
    }
    if (command == "--help" || command == "-h" || command == "help") {
      PrintUsage();
      return kExitOk;
    }
  } catch (const xk::KeyError& err) {
    std::cerr << "error: " << xk::KeyErrorKindName(err.kind) << ": " << err.what() << "\n";
    return kExitFailure;
  } catch (const xk::Error& err) {
    std::cerr << "error: " << err.what() << " (code " << err.code << ")\n";
    return kExitFailure;
  } catch (const std::exception& err) {
    std::cerr << "error: " << err.what() << "\n";
    return kExitFailure;
  }

  PrintUsage();
  return kExitUsage;
}
