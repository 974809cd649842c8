#include "kt/logging/audit.h"

#include <array>
#include <utility>

namespace kt::logging {
namespace {

constexpr std::string_view kAuditSeverityField{"audit_severity"};

constexpr std::array<AuditEventType, 7> kAllAuditTypes = {
    AuditEventType::kAuthSuccess,     AuditEventType::kAuthFailure, AuditEventType::kSessionTimeout,
    AuditEventType::kEmergencyAccess, AuditEventType::kDataReset,   AuditEventType::kSystemInit,
    AuditEventType::kSettingsChange,
};

EventSeverity ToEventSeverity(AuditSeverity severity) {
  switch (severity) {
    case AuditSeverity::kInfo:
      return EventSeverity::kInfo;
    case AuditSeverity::kWarning:
      return EventSeverity::kWarning;
    case AuditSeverity::kCritical:
      return EventSeverity::kCritical;
  }
  return EventSeverity::kInfo;
}

std::optional<AuditSeverity> ParseAuditSeverity(std::string_view name) {
  if (name == "INFO") {
    return AuditSeverity::kInfo;
  }
  if (name == "WARNING") {
    return AuditSeverity::kWarning;
  }
  if (name == "CRITICAL") {
    return AuditSeverity::kCritical;
  }
  return std::nullopt;
}

}  // namespace

const char* ToString(AuditEventType type) {
  switch (type) {
    case AuditEventType::kAuthSuccess:
      return "AUTH_SUCCESS";
    case AuditEventType::kAuthFailure:
      return "AUTH_FAILURE";
    case AuditEventType::kSessionTimeout:
      return "SESSION_TIMEOUT";
    case AuditEventType::kEmergencyAccess:
      return "EMERGENCY_ACCESS";
    case AuditEventType::kDataReset:
      return "DATA_RESET";
    case AuditEventType::kSystemInit:
      return "SYSTEM_INIT";
    case AuditEventType::kSettingsChange:
      return "SETTINGS_CHANGE";
  }
  return "SYSTEM_INIT";
}

const char* ToString(AuditSeverity severity) {
  switch (severity) {
    case AuditSeverity::kInfo:
      return "INFO";
    case AuditSeverity::kWarning:
      return "WARNING";
    case AuditSeverity::kCritical:
      return "CRITICAL";
  }
  return "INFO";
}

std::optional<AuditEventType> ParseAuditEventType(std::string_view name) {
  for (auto type : kAllAuditTypes) {
    if (name == ToString(type)) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<AuditEvent> AuditEventFromBusEvent(const Event& event) {
  if (event.category != EventCategory::kSecurity) {
    return std::nullopt;
  }
  auto type = ParseAuditEventType(event.event_id);
  if (!type) {
    return std::nullopt;
  }
  AuditEvent audit;
  audit.timestamp = event.timestamp;
  audit.type = *type;
  audit.detail = event.message;
  for (const auto& field : event.fields) {
    if (field.key == kAuditSeverityField) {
      if (auto severity = ParseAuditSeverity(field.value)) {
        audit.severity = *severity;
      }
    }
  }
  return audit;
}

AuditLog::AuditLog(EventBus& bus, const Clock& clock) : bus_(bus), clock_(clock) {}

void AuditLog::Record(AuditEventType type, AuditSeverity severity, std::string detail,
                      std::vector<EventField> fields) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = ToEventSeverity(severity);
  event.event_id = ToString(type);
  event.message = std::move(detail);
  event.timestamp = clock_.Now();
  event.fields.emplace_back(std::string(kAuditSeverityField), ToString(severity));
  for (auto& field : fields) {
    event.fields.push_back(std::move(field));
  }
  bus_.Publish(event);
}

}  // namespace kt::logging
