#pragma once

#include <cstddef>
#include <string_view>

namespace kt::auth {

inline constexpr std::size_t kDefaultPinLength = 4;

// Throws kt::ValidationError when the PIN is not exactly `length` ASCII digits.
void EnforcePinPolicy(std::string_view pin, std::size_t length = kDefaultPinLength);

// Non-throwing form for UI pre-checks.
[[nodiscard]] bool IsWellFormedPin(std::string_view pin,
                                   std::size_t length = kDefaultPinLength) noexcept;

}  // namespace kt::auth
