#include "kt/privacy/privacy_redactor.h"

#include <algorithm>
#include <utility>

namespace kt::privacy {
namespace {

using Span = std::pair<std::size_t, std::size_t>;

constexpr std::string_view kDigits{"0123456789"};

// Trailing boundary: no word character and no redaction token follows.
constexpr std::string_view kWordEnd{
    R"((?![A-Za-z0-9_]|\[(?:REDACTED|EMAIL_REDACTED|PHONE_REDACTED|SSN_REDACTED)\]))"};

const std::regex& TokenPattern() {
  static const std::regex pattern(R"(\[(?:REDACTED|EMAIL_REDACTED|PHONE_REDACTED|SSN_REDACTED)\])");
  return pattern;
}

// Every quantifier is bounded; libstdc++ matches recursively per character.
const RedactionRule& EmailRule() {
  static const RedactionRule rule{
      std::regex(std::string(R"([A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,253}\.[A-Za-z]{2,24})") +
                 std::string(kWordEnd)),
      kEmailToken, true, "@"};
  return rule;
}

// North American formats, optional country prefix.
const RedactionRule& PhoneRule() {
  static const RedactionRule rule{
      std::regex(R"((\+\d{1,2}\s?)?\(?\d{3}\)?[\s.-]?\d{3}[\s.-]?\d{4})"), kPhoneToken, false,
      kDigits};
  return rule;
}

const RedactionRule& SsnRule() {
  static const RedactionRule rule{
      std::regex(std::string(R"(\d{3}-\d{2}-\d{4})") + std::string(kWordEnd)), kSsnToken, true,
      kDigits};
  return rule;
}

std::string Trim(std::string_view value) {
  constexpr std::string_view kSpace{" \t\r\n\f\v"};
  const auto first = value.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(kSpace);
  return std::string(value.substr(first, last - first + 1));
}

bool IsWordChar(char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
}

std::vector<Span> TokenSpans(const std::string& text) {
  std::vector<Span> spans;
  if (text.find('[') == std::string::npos) {
    return spans;
  }
  for (std::sregex_iterator it(text.cbegin(), text.cend(), TokenPattern()), end; it != end; ++it) {
    const auto begin = static_cast<std::size_t>(it->position(0));
    spans.emplace_back(begin, begin + static_cast<std::size_t>(it->length(0)));
  }
  return spans;
}

std::string ApplyRule(const std::string& text, const RedactionRule& rule) {
  if (!rule.requires_any.empty() && text.find_first_of(rule.requires_any) == std::string::npos) {
    return text;
  }
  const auto tokens = TokenSpans(text);
  const auto token_ends_at = [&tokens](std::size_t pos) {
    return std::any_of(tokens.begin(), tokens.end(), [pos](const Span& t) { return t.second == pos; });
  };

  std::string out;
  std::size_t copied = 0;
  std::size_t pos = 0;
  std::smatch match;
  while (pos < text.size()) {
    const auto flags = pos > 0 ? std::regex_constants::match_prev_avail
                               : std::regex_constants::match_default;
    if (!std::regex_search(text.cbegin() + static_cast<std::ptrdiff_t>(pos), text.cend(), match,
                           rule.pattern, flags)) {
      break;
    }
    const auto start = pos + static_cast<std::size_t>(match.position(0));
    const auto stop = start + static_cast<std::size_t>(match.length(0));
    if (stop == start) {
      pos = start + 1;
      continue;
    }

    // First token that ends after the candidate starts.
    const auto token = std::find_if(tokens.begin(), tokens.end(),
                                    [start](const Span& t) { return t.second > start; });
    if (token != tokens.end() && token->first < stop) {
      pos = start < token->first ? start + 1 : token->second;
      continue;
    }
    if (rule.word_start && start > 0 && (IsWordChar(text[start - 1]) || token_ends_at(start))) {
      pos = start + 1;
      continue;
    }

    out.append(text, copied, start - copied);
    out.append(rule.replacement);
    copied = stop;
    pos = stop;
  }
  if (copied == 0) {
    return text;
  }
  out.append(text, copied, std::string::npos);
  return out;
}

}  // namespace

std::string EscapeRegex(std::string_view value) {
  static constexpr std::string_view kSpecial{R"(.*+?^${}()|[]\)"};
  std::string out;
  out.reserve(value.size() * 2);
  for (char ch : value) {
    if (kSpecial.find(ch) != std::string_view::npos) {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

PrivacyRedactor::PrivacyRedactor(const RedactionConfig& config) : enabled_(config.privacy_mode) {
  if (!enabled_) {
    return;
  }
  std::vector<std::string> names;
  names.reserve(config.extra_names.size() + 1);
  names.push_back(Trim(config.subject_name));
  for (const auto& extra : config.extra_names) {
    names.push_back(Trim(extra));
  }
  for (const auto& name : names) {
    if (name.empty()) {
      continue;
    }
    // Word boundaries only apply next to a word character, so a name that
    // starts or ends with punctuation is anchored on its other side alone.
    std::string pattern = EscapeRegex(name);
    if (IsWordChar(name.back())) {
      pattern += kWordEnd;
    }
    name_rules_.push_back(RedactionRule{std::regex(pattern, std::regex::ECMAScript | std::regex::icase),
                                        kNameToken, IsWordChar(name.front()), {}});
  }
}

std::string PrivacyRedactor::Redact(std::string_view text) const {
  std::string clean(text);
  if (!enabled_) {
    return clean;
  }
  for (const auto& rule : name_rules_) {
    clean = ApplyRule(clean, rule);
  }
  clean = ApplyRule(clean, EmailRule());
  clean = ApplyRule(clean, PhoneRule());
  clean = ApplyRule(clean, SsnRule());
  return clean;
}

std::string Redact(std::string_view text, const RedactionConfig& config) {
  if (!config.privacy_mode) {
    return std::string(text);
  }
  return PrivacyRedactor(config).Redact(text);
}

}  // namespace kt::privacy
