#pragma once

#include <cstdint>
#include <span>

namespace kt::crypto {

// Fills `out` from the operating system CSPRNG. Throws kt::Error{Crypto} when
// no source is available.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace kt::crypto
