#include "kt/auth/pin_policy.h"

#include <string>

#include "kt/error.h"
#include "kt/errors.h"

namespace kt::auth {
namespace {

bool AllDigits(std::string_view pin) noexcept {
  // Visit every character so the scan time depends only on the length.
  unsigned bad = 0;
  for (unsigned char ch : pin) {
    bad |= static_cast<unsigned>(ch < '0' || ch > '9');
  }
  return bad == 0;
}

}  // namespace

bool IsWellFormedPin(std::string_view pin, std::size_t length) noexcept {
  const bool digits = AllDigits(pin);
  return pin.size() == length && digits;
}

void EnforcePinPolicy(std::string_view pin, std::size_t length) {
  const bool digits = AllDigits(pin);
  if (pin.size() != length) {
    throw kt::ValidationError(std::string(kt::errors::msg::kPinWrongLength) + " (expected " +
                              std::to_string(length) + " digits)");
  }
  if (!digits) {
    throw kt::ValidationError(std::string(kt::errors::msg::kPinNotNumeric));
  }
}

}  // namespace kt::auth
