#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace kt::crypto {

inline constexpr uint32_t kMinPbkdf2Iterations = 100'000;

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace kt::crypto
