#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kt/clock.h"
#include "kt/logging/event_bus.h"

namespace kt::logging {

enum class AuditEventType {
  kAuthSuccess,
  kAuthFailure,
  kSessionTimeout,
  kEmergencyAccess,
  kDataReset,
  kSystemInit,
  kSettingsChange,
};

enum class AuditSeverity { kInfo, kWarning, kCritical };

struct AuditEvent {
  Clock::TimePoint timestamp{};
  AuditEventType type{AuditEventType::kSystemInit};
  AuditSeverity severity{AuditSeverity::kInfo};
  std::string detail;
};

// Wire names, e.g. "AUTH_SUCCESS" and "WARNING".
const char* ToString(AuditEventType type);
const char* ToString(AuditSeverity severity);
std::optional<AuditEventType> ParseAuditEventType(std::string_view name);

// Recovers an AuditEvent from a bus event published by AuditLog; std::nullopt
// for anything else on the bus.
std::optional<AuditEvent> AuditEventFromBusEvent(const Event& event);

// Emits audit records onto an EventBus as kSecurity events whose event_id is
// the audit type. Detail strings must already be free of PINs and PII.
class AuditLog {
 public:
  explicit AuditLog(EventBus& bus, const Clock& clock = DefaultClock());

  void Record(AuditEventType type, AuditSeverity severity, std::string detail,
              std::vector<EventField> fields = {});

 private:
  EventBus& bus_;
  const Clock& clock_;
};

}  // namespace kt::logging
