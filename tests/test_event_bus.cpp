#include "kt/logging/event_bus.h"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "kt/clock.h"
#include "kt/logging/audit.h"

namespace {

class TempDir {
public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("kt_audit_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

std::string ReadText(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

kt::logging::Event MakeEvent(const std::string& id) {
  kt::logging::Event event;
  event.category = kt::logging::EventCategory::kSecurity;
  event.severity = kt::logging::EventSeverity::kWarning;
  event.event_id = id;
  event.message = "line \"" + id + "\"";
  event.timestamp = std::chrono::system_clock::time_point(std::chrono::seconds(1'700'000'000));
  return event;
}

}  // namespace

int main() {
  using kt::logging::EventField;
  using kt::logging::FieldPrivacy;

  assert(kt::logging::HashForTelemetry("").empty());
  assert(kt::logging::HashForTelemetry("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  {
    auto event = MakeEvent("AUTH_FAILURE");
    event.fields.emplace_back("principal", "u-42", FieldPrivacy::kRedact);
    event.fields.emplace_back("device", "abc", FieldPrivacy::kHash);
    event.fields.emplace_back("attempts", "3", FieldPrivacy::kPublic, true);
    event.fields.emplace_back("secret_count", "7", FieldPrivacy::kRedact, true);
    const auto json = kt::logging::FormatEventJson(event);
    assert(json.rfind("{\"ts\":\"2023-11-14T22:13:20.000000Z\"", 0) == 0);
    assert(json.find("\"severity\":\"warning\"") != std::string::npos);
    assert(json.find("\"category\":\"security\"") != std::string::npos);
    assert(json.find("\"event_id\":\"AUTH_FAILURE\"") != std::string::npos);
    assert(json.find("\"message\":\"line \\\"AUTH_FAILURE\\\"\"") != std::string::npos);
    assert(json.find("\"principal\":\"[REDACTED]\"") != std::string::npos);
    assert(json.find("u-42") == std::string::npos);
    assert(json.find("\"device\":\"hash:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\"") !=
           std::string::npos);
    assert(json.find("\"attempts\":3") != std::string::npos);
    assert(json.find("\"secret_count\":\"[REDACTED]\"") != std::string::npos);
    assert(json.back() == '}');
  }

  {
    kt::logging::EventBus bus;
    std::vector<std::string> first;
    std::vector<std::string> second;
    bus.Subscribe([&](const kt::logging::Event& event) {
      first.push_back(event.event_id);
      // Nested publishes are dropped instead of recursing.
      bus.Publish(MakeEvent("nested"));
    });
    bus.Subscribe([&](const kt::logging::Event& event) { second.push_back(event.event_id); });
    assert(bus.SubscriberCount() == 2);

    bus.Publish(MakeEvent("one"));
    bus.Publish(MakeEvent("two"));
    assert((first == std::vector<std::string>{"one", "two"}));
    assert((second == std::vector<std::string>{"one", "two"}));
  }

  {
    kt::ManualClock clock;
    kt::logging::EventBus bus;
    kt::logging::AuditLog audit(bus, clock);
    std::vector<kt::logging::AuditEvent> records;
    size_t other = 0;
    bus.Subscribe([&](const kt::logging::Event& event) {
      if (auto record = kt::logging::AuditEventFromBusEvent(event)) {
        records.push_back(*record);
      } else {
        ++other;
      }
    });

    audit.Record(kt::logging::AuditEventType::kDataReset, kt::logging::AuditSeverity::kCritical,
                 "All local security state erased");
    bus.Publish(MakeEvent("cli_error"));
    assert(records.size() == 1);
    assert(other == 1);
    assert(records[0].type == kt::logging::AuditEventType::kDataReset);
    assert(records[0].severity == kt::logging::AuditSeverity::kCritical);
    assert(records[0].detail == "All local security state erased");
    assert(records[0].timestamp == clock.Now());

    assert(std::string(kt::logging::ToString(kt::logging::AuditEventType::kEmergencyAccess)) ==
           "EMERGENCY_ACCESS");
    assert(kt::logging::ParseAuditEventType("SESSION_TIMEOUT") ==
           kt::logging::AuditEventType::kSessionTimeout);
    assert(!kt::logging::ParseAuditEventType("session_timeout").has_value());
  }

  {
    TempDir dir;
    const auto log_path = dir.path() / "audit.jsonl";
    {
      kt::logging::JsonLineLogger logger(log_path);
      assert(logger.healthy());
      assert(logger.entries() == 0);
      assert(logger.Verify());
      for (int i = 0; i < 3; ++i) {
        logger.Log(MakeEvent("AUTH_SUCCESS"));
      }
      assert(logger.entries() == 3);
      assert(logger.Verify());
    }
    assert(std::filesystem::exists(log_path.string() + ".key"));
    const auto text = ReadText(log_path);
    assert(text.find("\"audit_seq\":3,\"audit_mac\":\"") != std::string::npos);

    {
      // Reopening continues the chain.
      kt::logging::JsonLineLogger reopened(log_path);
      assert(reopened.healthy());
      assert(reopened.entries() == 3);
      reopened.Log(MakeEvent("SESSION_TIMEOUT"));
      assert(reopened.entries() == 4);
      assert(reopened.Verify());
    }

    // Rewriting any line breaks the chain; the logger refuses to extend it.
    auto tampered = ReadText(log_path);
    const auto pos = tampered.find("warning");
    assert(pos != std::string::npos);
    tampered.replace(pos, 7, "info___");
    {
      std::ofstream out(log_path, std::ios::trunc);
      out << tampered;
    }
    kt::logging::JsonLineLogger broken(log_path);
    assert(!broken.healthy());
    assert(!broken.Verify());
    broken.Log(MakeEvent("AUTH_FAILURE"));
    assert(ReadText(log_path) == tampered);
  }

  std::cout << "event bus tests ok\n";
  return 0;
}
