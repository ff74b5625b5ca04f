#include "xk/codec/hex.h"
#include "xk/key/validator.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string_view>

namespace {

xk::codec::KeyBytes Decode(std::string_view text) {
  xk::codec::KeyBytes out{};
  [[maybe_unused]] auto kind = xk::codec::DecodeHex(text, out);
  assert(!kind);
  return out;
}

void FlipBit(xk::codec::KeyBytes& key, std::size_t bit) {
  key[bit >> 3] ^= static_cast<std::uint8_t>(1u << (bit & 7));
}

} // namespace

int main() {
  using namespace xk::key;

  static_assert(kDataBits + kEcdBits == kKeyBits);
  static_assert(kRequiredHammingWeight == 53);

  for (std::string_view text : {"C0DE8DAAE05493BCB0F1664FB1751F00",
                                "C0B33D79A74BE3832B0E6172AC491F00",
                                "C0FE2270D42B8FABBD5D4B0D402FCF00"}) {
    auto key = Decode(text);
    assert(HammingWeight(key) == kRequiredHammingWeight);
    assert(HammingWeightOk(key));
    assert(EcdOk(key));
    assert(!Validate(key));

    auto resealed = key;
    ComputeEcd(resealed);
    assert(resealed == key && "sealing a valid key is idempotent");

    // Clearing the check field and resealing restores it.
    auto cleared = key;
    for (std::size_t bit = kDataBits; bit < kKeyBits; ++bit) {
      cleared[bit >> 3] &= static_cast<std::uint8_t>(~(1u << (bit & 7)));
    }
    ComputeEcd(cleared);
    assert(cleared == key);
  }

  // Any single flipped check bit breaks the ECD but not the weight.
  {
    const auto base = Decode("C0DE8DAAE05493BCB0F1664FB1751F00");
    for (std::size_t bit = kDataBits; bit < kKeyBits; ++bit) {
      auto key = base;
      FlipBit(key, bit);
      assert(HammingWeightOk(key));
      assert(!EcdOk(key));
      assert(Validate(key) == xk::KeyErrorKind::kEcd);
    }
  }

  // A flipped data bit changes the weight; resealing fixes the ECD only.
  {
    auto key = Decode("C0DE8DAAE05493BCB0F1664FB1751F00");
    FlipBit(key, 0);
    assert(HammingWeight(key) == kRequiredHammingWeight + 1);
    assert(Validate(key) == xk::KeyErrorKind::kHammingWeight);
    ComputeEcd(key);
    assert(key == Decode("C1DE8DAAE05493BCB0F1664FB1E113D8"));
    assert(EcdOk(key));
    assert(!HammingWeightOk(key));
    assert(Validate(key) == xk::KeyErrorKind::kHammingWeight);
  }

  {
    const auto key = Decode("C0DE8DAAE05493BCB0F1664FB1751F0F");
    assert(HammingWeightOk(key));
    assert(Validate(key) == xk::KeyErrorKind::kEcd);
  }

  {
    const xk::codec::KeyBytes zero{};
    assert(HammingWeight(zero) == 0);
    assert(Validate(zero) == xk::KeyErrorKind::kEmpty);
  }

  std::cout << "validator ok\n";
  return 0;
}
