#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "kt/crypto/provider.h"

namespace kt::logging {

  // structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
    std::chrono::system_clock::time_point timestamp{};  // zero means "now" at the sink
  };

  // Lowercase hex SHA-256, or empty for empty input.
  std::string HashForTelemetry(std::string_view input);

  const char* SeverityToString(EventSeverity severity);
  const char* CategoryToString(EventCategory category);

  // Renders an event as one JSON object, applying per-field privacy.
  std::string FormatEventJson(const Event& event);

  // Append-only JSON-lines sink. Each line carries a sequence number and an
  // HMAC-SHA256 chained over the previous line's tag, keyed by a random key
  // stored beside the log. A chain that fails to verify on open disables the
  // logger rather than extending a broken chain.
  class JsonLineLogger {
  public:
    explicit JsonLineLogger(std::filesystem::path log_path);

    JsonLineLogger(const JsonLineLogger&) = delete;
    JsonLineLogger& operator=(const JsonLineLogger&) = delete;

    void Log(const Event& event);

    // Re-reads the file and checks every link of the chain.
    [[nodiscard]] bool Verify() const;

    [[nodiscard]] bool healthy() const noexcept { return integrity_ok_; }
    [[nodiscard]] uint64_t entries() const noexcept { return entry_counter_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    using Mac = std::array<uint8_t, kt::crypto::kHmacTagSize>;

    void EnsureKey();
    bool ParseLog(Mac& mac, uint64_t& sequence) const;

    mutable std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    std::filesystem::path key_path_;
    Mac hmac_key_{};
    Mac last_mac_{};
    uint64_t entry_counter_{0};
    bool integrity_ok_{true};
  };

  // Synchronous fan-out to subscribers. Publishing from inside a subscriber is
  // suppressed rather than recursed.
  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    EventBus();
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // Process-wide bus used by the command line tool.
    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);
    [[nodiscard]] size_t SubscriberCount() const;

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    mutable std::mutex subscribers_mutex_;
  };

} // namespace kt::logging
