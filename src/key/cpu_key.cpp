#include "xk/key/cpu_key.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include "xk/config.h"
#include "xk/crypto/ct.h"
#include "xk/crypto/digest.h"
#include "xk/crypto/random.h"
#include "xk/diagnostics/event_bus.h"
#include "xk/errors.h"
#include "xk/key/validator.h"

namespace xk::key {
namespace {

using diagnostics::Event;
using diagnostics::EventBus;
using diagnostics::EventCategory;
using diagnostics::EventSeverity;
using diagnostics::FieldPrivacy;

std::string_view AsText(std::span<const std::uint8_t> bytes) {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

// Diagnostics never replace the outcome of the key operation that raised them.
template <typename BuildEvent>
void PublishBestEffort(std::string_view event_id, BuildEvent&& build) {
  auto& bus = EventBus::Instance();
  if (!bus.HasSubscribers()) {
    return;
  }
  try {
    bus.Publish(build());
  } catch (const std::exception&) {
    std::clog << "{\"event\":\"event_publish_failed\",\"event_id\":\"" << event_id << "\"}"
              << std::endl;
  }
}

void PublishRejection(KeyErrorKind kind, std::string_view reason, std::string_view raw_input) {
  PublishBestEffort("key.parse.rejected", [&] {
    Event event;
    event.category = EventCategory::kSecurity;
    event.severity = EventSeverity::kDebug;
    event.event_id = "key.parse.rejected";
    event.message = std::string(reason);
    event.fields.emplace_back("kind", std::string(KeyErrorKindName(kind)));
    event.fields.emplace_back("input_length", std::to_string(raw_input.size()),
                              FieldPrivacy::kPublic, true);
    // Key material never reaches a log in clear.
    event.fields.emplace_back("input", std::string(raw_input), FieldPrivacy::kHash);
    return event;
  });
}

[[noreturn]] void ThrowKeyError(KeyErrorKind kind, std::string_view reason,
                                std::string_view raw_input) {
  PublishRejection(kind, reason, raw_input);
  throw KeyError(kind, std::string(reason));
}

std::optional<KeyErrorKind> DecodeText(std::string_view text, CpuKey::Bytes& out) noexcept {
  if (auto kind = codec::DecodeHex(text, out)) {
    return kind;
  }
  return Validate(out);
}

std::optional<KeyErrorKind> CopyBytes(std::span<const std::uint8_t> bytes,
                                      CpuKey::Bytes& out) noexcept {
  if (auto kind = codec::CheckByteShape(bytes)) {
    return kind;
  }
  std::copy(bytes.begin(), bytes.end(), out.begin());
  return Validate(out);
}

std::string_view ByteFailureReason(KeyErrorKind kind) {
  return kind == KeyErrorKind::kShape ? errors::msg::kKeyByteLength
                                      : codec::DescribeTextFailure({}, kind);
}

}  // namespace

CpuKey::CpuKey(std::span<const std::uint8_t> bytes) {
  if (auto kind = CopyBytes(bytes, bytes_)) {
    ThrowKeyError(*kind, ByteFailureReason(*kind), AsText(bytes));
  }
}

CpuKey::CpuKey(std::string_view text) {
  if (auto kind = DecodeText(text, bytes_)) {
    ThrowKeyError(*kind, codec::DescribeTextFailure(text, *kind), text);
  }
}

CpuKey::CpuKey(const char* text) {
  if (text == nullptr) {
    ThrowKeyError(KeyErrorKind::kNullInput, errors::msg::kNullKeyText, {});
  }
  *this = CpuKey(std::string_view(text));
}

const CpuKey& CpuKey::Empty() noexcept {
  static const CpuKey kEmpty{};
  return kEmpty;
}

CpuKey CpuKey::Parse(std::span<const std::uint8_t> bytes) {
  return CpuKey(bytes);
}

CpuKey CpuKey::Parse(std::string_view text) {
  return CpuKey(text);
}

CpuKey CpuKey::Parse(const char* text) {
  return CpuKey(text);
}

bool CpuKey::TryParse(std::span<const std::uint8_t> bytes, std::optional<CpuKey>& out) noexcept {
  Bytes decoded{};
  auto kind = CopyBytes(bytes, decoded);
  if (!kind) {
    out = CpuKey(decoded, Unchecked{});
    return true;
  }
  if (IsMalformedKind(*kind)) {
    out.reset();
  } else {
    out = Empty();
  }
  return false;
}

bool CpuKey::TryParse(std::string_view text, std::optional<CpuKey>& out) noexcept {
  Bytes decoded{};
  auto kind = DecodeText(text, decoded);
  if (!kind) {
    out = CpuKey(decoded, Unchecked{});
    return true;
  }
  if (IsMalformedKind(*kind)) {
    out.reset();
  } else {
    out = Empty();
  }
  return false;
}

bool CpuKey::TryParse(const char* text, std::optional<CpuKey>& out) noexcept {
  if (text == nullptr) {
    out.reset();
    return false;
  }
  return TryParse(std::string_view(text), out);
}

std::optional<KeyErrorKind> CpuKey::Check(std::span<const std::uint8_t> bytes) noexcept {
  Bytes scratch{};
  return CopyBytes(bytes, scratch);
}

std::optional<KeyErrorKind> CpuKey::Check(std::string_view text) noexcept {
  Bytes scratch{};
  return DecodeText(text, scratch);
}

CpuKey CpuKey::CreateRandom() {
  return CreateRandom([](std::span<std::uint8_t> out) { crypto::SystemRandomBytes(out); });
}

CpuKey CpuKey::CreateRandom(const RandomSource& source) {
  const std::size_t limit = config::Current().random_max_attempts;
  Bytes candidate{};
  for (std::size_t attempt = 1; attempt <= limit; ++attempt) {
    source(candidate);
    if (codec::IsAllZero(candidate) || !HammingWeightOk(candidate)) {
      continue;
    }
    ComputeEcd(candidate);
    PublishBestEffort("key.random.generated", [attempt] {
      Event event;
      event.category = EventCategory::kTelemetry;
      event.severity = EventSeverity::kDebug;
      event.event_id = "key.random.generated";
      event.fields.emplace_back("attempts", std::to_string(attempt), FieldPrivacy::kPublic, true);
      return event;
    });
    return CpuKey(candidate, Unchecked{});
  }

  PublishBestEffort("key.random.exhausted", [limit] {
    Event event;
    event.category = EventCategory::kDiagnostics;
    event.severity = EventSeverity::kError;
    event.event_id = "key.random.exhausted";
    event.message = std::string(errors::msg::kRandomAttemptsExhausted);
    event.fields.emplace_back("limit", std::to_string(limit), FieldPrivacy::kPublic, true);
    return event;
  });
  throw Error(ErrorDomain::Internal, errors::internal::kRandomAttemptsExhausted,
              std::string(errors::msg::kRandomAttemptsExhausted) + " (" + std::to_string(limit) +
                  ")");
}

bool CpuKey::IsValid() const noexcept {
  return !Validate(bytes_).has_value();
}

bool CpuKey::IsEmpty() const noexcept {
  return codec::IsAllZero(bytes_);
}

std::string CpuKey::ToString() const {
  return codec::EncodeHex(bytes_);
}

CpuKey::Digest CpuKey::GetDigest() const {
  return crypto::SHA1_Hash(bytes_);
}

std::size_t CpuKey::Hash() const noexcept {
  return std::hash<std::string_view>{}(AsText(bytes_));
}

bool CpuKey::Equals(const CpuKey& other) const noexcept {
  return crypto::ct::CompareEqual(bytes_, other.bytes_);
}

bool CpuKey::Equals(std::span<const std::uint8_t> bytes) const noexcept {
  return crypto::ct::CompareEqual(std::span<const std::uint8_t>(bytes_), bytes);
}

bool CpuKey::Equals(std::string_view text) const noexcept {
  return codec::EqualsHex(bytes_, text);
}

int CpuKey::Compare(const CpuKey& other) const noexcept {
  const auto order = *this <=> other;
  if (order < 0) {
    return -1;
  }
  return order > 0 ? 1 : 0;
}

int CpuKey::Compare(const CpuKey* other) const noexcept {
  return other == nullptr ? 1 : Compare(*other);
}

std::strong_ordering operator<=>(const CpuKey& a, const CpuKey& b) noexcept {
  return std::lexicographical_compare_three_way(a.bytes_.begin(), a.bytes_.end(),
                                                b.bytes_.begin(), b.bytes_.end());
}

std::ostream& operator<<(std::ostream& os, const CpuKey& key) {
  return os << key.ToString();
}

}  // namespace xk::key
