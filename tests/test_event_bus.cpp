#include "fpg/crypto/sha256.h"
#include "fpg/orchestrator/event_bus.h"

#include "test_support.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using fpg::orchestrator::BuildEventJson;
using fpg::orchestrator::Event;
using fpg::orchestrator::EventCategory;
using fpg::orchestrator::EventField;
using fpg::orchestrator::EventSeverity;
using fpg::orchestrator::FieldPrivacy;
using fpg::testing::Contains;

void TestSha256KnownAnswer() {
  // FIPS 180-2 "abc" vector.
  assert(fpg::crypto::SHA256_Hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

void TestFieldPrivacy() {
  Event event;
  event.category = EventCategory::kTelemetry;
  event.severity = EventSeverity::kWarning;
  event.event_id = "unit_encrypted";
  event.message = "Unit \"encrypted\"";
  event.fields.emplace_back("file", "abc", FieldPrivacy::kHash);
  event.fields.emplace_back("secret", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("size_mb", "12.5", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("mode", "manual");

  auto json = BuildEventJson(event, "2024-01-01T00:00:00.000000Z");
  assert(json.front() == '{' && json.back() == '}');
  assert(Contains(json, "\"severity\":\"warning\""));
  assert(Contains(json, "\"category\":\"telemetry\""));
  assert(Contains(json, "\"event_id\":\"unit_encrypted\""));
  assert(Contains(json, "\"message\":\"Unit \\\"encrypted\\\"\""));
  assert(Contains(json,
                  "\"file\":\"hash:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad\""));
  assert(Contains(json, "\"secret\":\"[REDACTED]\""));
  assert(!Contains(json, "hunter2"));
  assert(Contains(json, "\"size_mb\":12.5"));
  assert(Contains(json, "\"mode\":\"manual\""));
}

void TestSubscribersReceiveEvents() {
  fpg::orchestrator::ResetEventBusForTesting();
  std::vector<std::string> ids;
  fpg::orchestrator::EventBus::Instance().Subscribe(
      [&ids](const Event& event) { ids.push_back(event.event_id); });
  fpg::orchestrator::PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "run_completed",
                                  "Batch completed");
  assert(ids.size() == 1 && ids.front() == "run_completed");

  // A throwing subscriber does not escape PublishEvent.
  fpg::orchestrator::EventBus::Instance().Subscribe(
      [](const Event&) { throw std::runtime_error("subscriber failure"); });
  fpg::orchestrator::PublishEvent(EventSeverity::kInfo, EventCategory::kLifecycle, "run_aborted",
                                  "Batch aborted");
  assert(ids.size() == 2);
  fpg::orchestrator::ResetEventBusForTesting();
}

void TestLoggerWritesJsonLines() {
  fpg::testing::TempDir dir("logger");
  const auto path = dir.path() / "nested" / "fpg.log";
  {
    fpg::orchestrator::JsonLineLogger logger(path);
    assert(logger.Path() == path);
    Event event;
    event.event_id = "inventory_scanned";
    event.fields.emplace_back("files", "2", FieldPrivacy::kPublic, true);
    logger.Log(event);
    event.event_id = "run_completed";
    logger.Log(event);
  }
  std::ifstream in(path);
  std::string line;
  std::vector<std::string> lines;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  assert(lines.size() == 2);
  assert(Contains(lines[0], "\"event_id\":\"inventory_scanned\""));
  assert(Contains(lines[0], "\"files\":2"));
  assert(Contains(lines[0], "\"ts\":\""));
  assert(Contains(lines[1], "\"event_id\":\"run_completed\""));
}

void TestDefaultLogPathLeavesWorkingDirectory() {
  fpg::testing::TempDir state("log_state");
  ::unsetenv("FPG_LOG_PATH");

  ::setenv("XDG_STATE_HOME", state.path().c_str(), 1);
  assert(fpg::orchestrator::JsonLineLogger().Path() == state.path() / "fpg" / "fpg.log");

  // Relative XDG_STATE_HOME values are ignored.
  ::setenv("XDG_STATE_HOME", "relative/state", 1);
  ::setenv("HOME", state.path().c_str(), 1);
  assert(fpg::orchestrator::JsonLineLogger().Path() ==
         state.path() / ".local" / "state" / "fpg" / "fpg.log");

  ::unsetenv("XDG_STATE_HOME");
  assert(fpg::orchestrator::JsonLineLogger().Path() ==
         state.path() / ".local" / "state" / "fpg" / "fpg.log");

  ::setenv("FPG_LOG_PATH", "/var/tmp/custom.log", 1);
  assert(fpg::orchestrator::JsonLineLogger().Path() == "/var/tmp/custom.log");
  ::unsetenv("FPG_LOG_PATH");

  // Constructing a logger does not create anything until an event is logged.
  ::setenv("XDG_STATE_HOME", state.path().c_str(), 1);
  fpg::orchestrator::JsonLineLogger idle;
  assert(!std::filesystem::exists(state.path() / "fpg"));
}

}  // namespace

int main() {
  TestSha256KnownAnswer();
  TestFieldPrivacy();
  TestSubscribersReceiveEvents();
  TestLoggerWritesJsonLines();
  TestDefaultLogPathLeavesWorkingDirectory();
  std::cout << "event bus ok\n";
  return 0;
}
