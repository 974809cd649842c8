#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace kt::privacy {

inline constexpr std::string_view kNameToken{"[REDACTED]"};
inline constexpr std::string_view kEmailToken{"[EMAIL_REDACTED]"};
inline constexpr std::string_view kPhoneToken{"[PHONE_REDACTED]"};
inline constexpr std::string_view kSsnToken{"[SSN_REDACTED]"};

struct RedactionConfig {
  bool privacy_mode{false};
  std::string subject_name;
  std::vector<std::string> extra_names;
};

// Escapes ECMAScript regex metacharacters so `value` matches literally.
std::string EscapeRegex(std::string_view value);

// One pattern and the token that replaces its matches. A rule with
// `word_start` set only matches where the preceding character is neither a
// word character nor the end of a redaction token. `requires_any` lists
// characters the text must contain for the rule to run at all.
struct RedactionRule {
  std::regex pattern;
  std::string_view replacement;
  bool word_start{false};
  std::string_view requires_any;
};

// Scrubs names, emails, phone numbers and SSN-like sequences from free text
// bound for an external sink. Names are compiled once per instance. Matches
// never overlap an existing redaction token, and a token counts as a word on
// either side of a candidate, so Redact(Redact(x)) == Redact(x).
class PrivacyRedactor {
 public:
  explicit PrivacyRedactor(const RedactionConfig& config);

  [[nodiscard]] std::string Redact(std::string_view text) const;
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }
  [[nodiscard]] std::size_t name_rule_count() const noexcept { return name_rules_.size(); }

 private:
  bool enabled_{false};
  std::vector<RedactionRule> name_rules_;
};

// One-shot form; a no-op when privacy_mode is off.
std::string Redact(std::string_view text, const RedactionConfig& config);

}  // namespace kt::privacy
