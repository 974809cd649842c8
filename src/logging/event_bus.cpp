#include "kt/logging/event_bus.h"

#include "kt/common.h"
#include "kt/crypto/ct.h"
#include "kt/crypto/random.h"
#include "kt/crypto/sha256.h"
#include "kt/error.h"
#include "kt/store/io_util.h"

#include <algorithm>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace kt::logging {
namespace {

constexpr size_t kHmacSize = kt::crypto::kHmacTagSize;
constexpr std::string_view kMacMarker{",\"audit_mac\":\""};
constexpr std::string_view kSeqMarker{"\"audit_seq\":"};

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

std::array<uint8_t, kHmacSize> ComputeChainedMac(const std::array<uint8_t, kHmacSize>& key,
                                                 const std::array<uint8_t, kHmacSize>& previous,
                                                 uint64_t previous_count, uint64_t sequence,
                                                 std::string_view canonical) {
  const uint64_t previous_le = kt::ToLittleEndian64(previous_count);
  const uint64_t sequence_le = kt::ToLittleEndian64(sequence);
  std::vector<uint8_t> buffer;
  buffer.reserve(previous.size() + sizeof(previous_le) + sizeof(sequence_le) + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  auto previous_bytes = kt::AsBytesConst(previous_le);
  buffer.insert(buffer.end(), previous_bytes.begin(), previous_bytes.end());
  auto sequence_bytes = kt::AsBytesConst(sequence_le);
  buffer.insert(buffer.end(), sequence_bytes.begin(), sequence_bytes.end());
  auto canonical_bytes = kt::AsBytes(canonical);
  buffer.insert(buffer.end(), canonical_bytes.begin(), canonical_bytes.end());
  return kt::crypto::ComputeHmacSha256(std::span<const uint8_t>(key.data(), key.size()),
                                          std::span<const uint8_t>(buffer.data(), buffer.size()));
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  auto digest = kt::crypto::SHA256_Hash(input);
  return kt::HexEncode(std::span<const uint8_t>(digest.data(), digest.size()));
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string FormatEventJson(const Event& event) {
  const auto ts = event.timestamp == std::chrono::system_clock::time_point{}
                      ? std::chrono::system_clock::now()
                      : event.timestamp;
  std::string payload;
  payload.reserve(256);
  payload += "{\"ts\":\"";
  payload += FormatTimestamp(ts);
  payload += "\",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"";
    payload += EscapeJson(event.event_id);
    payload += "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"";
    payload += EscapeJson(event.message);
    payload += "\"";
  }
  for (const auto& field : event.fields) {
    payload += ",\"";
    payload += EscapeJson(field.key);
    payload += "\":";
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = "hash:" + HashForTelemetry(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload += sanitized;
    } else {
      payload += "\"";
      payload += EscapeJson(sanitized);
      payload += "\"";
    }
  }
  payload += "}";
  return payload;
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path)
    : log_path_(std::move(log_path)), key_path_(log_path_.string() + ".key") {
  last_mac_.fill(0);
  EnsureKey();
  if (!integrity_ok_) {
    return;
  }
  Mac existing_mac{};
  existing_mac.fill(0);
  uint64_t existing_seq = 0;
  if (!ParseLog(existing_mac, existing_seq)) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"unable to verify existing audit log\"}"
              << std::endl;
    integrity_ok_ = false;
    return;
  }
  last_mac_ = existing_mac;
  entry_counter_ = existing_seq;
}

void JsonLineLogger::EnsureKey() {
  auto existing = kt::store::ReadFileBytes(key_path_);
  if (existing) {
    if (existing->size() != hmac_key_.size()) {
      std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit key malformed\"}"
                << std::endl;
      integrity_ok_ = false;
      return;
    }
    std::copy(existing->begin(), existing->end(), hmac_key_.begin());
    return;
  }
  kt::crypto::SystemRandomBytes(std::span<uint8_t>(hmac_key_.data(), hmac_key_.size()));
  kt::store::AtomicReplace(key_path_, std::span<const uint8_t>(hmac_key_.data(), hmac_key_.size()));
}

bool JsonLineLogger::ParseLog(Mac& mac, uint64_t& sequence) const {
  std::ifstream in(log_path_);
  if (!in) {
    std::error_code ec;
    // A log that does not exist yet is an empty, valid chain.
    return !std::filesystem::exists(log_path_, ec) && !ec;
  }
  Mac previous{};
  previous.fill(0);
  uint64_t count = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    const auto marker = line.rfind(kMacMarker);
    const size_t mac_hex_len = kHmacSize * 2;
    if (marker == std::string::npos || line.size() != marker + kMacMarker.size() + mac_hex_len + 2) {
      return false;
    }
    const std::string prefix = line.substr(0, marker);
    const auto mac_hex = std::string_view(line).substr(marker + kMacMarker.size(), mac_hex_len);
    auto stored = kt::HexDecode(mac_hex);
    if (!stored || stored->size() != kHmacSize) {
      return false;
    }
    const auto seq_pos = prefix.rfind(kSeqMarker);
    if (seq_pos == std::string::npos) {
      return false;
    }
    uint64_t seq = 0;
    const char* begin = prefix.data() + seq_pos + kSeqMarker.size();
    const char* end = prefix.data() + prefix.size();
    auto [ptr, ec] = std::from_chars(begin, end, seq);
    if (ec != std::errc() || ptr != end || seq != count + 1) {
      return false;
    }
    const std::string canonical = prefix + "}";
    auto expected = ComputeChainedMac(hmac_key_, previous, count, seq, canonical);
    if (!kt::crypto::ct::CompareEqual(std::span<const uint8_t>(stored->data(), stored->size()),
                                      std::span<const uint8_t>(expected.data(), expected.size()))) {
      return false;
    }
    previous = expected;
    count = seq;
  }
  mac = previous;
  sequence = count;
  return true;
}

bool JsonLineLogger::Verify() const {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return false;
  }
  Mac mac{};
  uint64_t sequence = 0;
  if (!ParseLog(mac, sequence)) {
    return false;
  }
  return sequence == entry_counter_ && mac == last_mac_;
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return;
  }
  const auto base = FormatEventJson(event);
  const uint64_t previous_count = entry_counter_;
  const uint64_t next_sequence = previous_count + 1;
  std::string prefix = base.substr(0, base.size() - 1);
  prefix.append(",\"audit_prev_count\":");
  prefix.append(std::to_string(previous_count));
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(next_sequence));
  const std::string canonical = prefix + "}";
  auto mac = ComputeChainedMac(hmac_key_, last_mac_, previous_count, next_sequence, canonical);
  std::string line = prefix;
  line.append(kMacMarker);
  line.append(kt::HexEncode(std::span<const uint8_t>(mac.data(), mac.size())));
  line.append("\"}");

  if (!stream_.is_open()) {
    stream_.open(log_path_, std::ios::out | std::ios::app);
  }
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}" << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log write failed\"}" << std::endl;
    integrity_ok_ = false;
    return;
  }
  last_mac_ = mac;
  entry_counter_ = next_sequence;
}

EventBus::EventBus() {
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::shared_ptr<const SubscriberList>(std::make_shared<SubscriberList>()),
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  static EventBus bus;
  return bus;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

size_t EventBus::SubscriberCount() const {
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  return current ? current->size() : 0;
}

} // namespace kt::logging
