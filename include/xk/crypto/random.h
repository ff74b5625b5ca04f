#pragma once

#include <cstdint>
#include <span>

namespace xk::crypto {

// Fills `out` from the operating system CSPRNG. Throws xk::Error (Crypto)
// when no entropy source is usable.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace xk::crypto
