#include "warden/orchestrator/event_bus.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "warden/crypto/provider.h"
#include "warden/orchestrator/io_util.h"

namespace {

using warden::orchestrator::AuditLogOptions;
using warden::orchestrator::Event;
using warden::orchestrator::EventBus;
using warden::orchestrator::EventCategory;
using warden::orchestrator::EventSeverity;
using warden::orchestrator::FieldPrivacy;
using warden::orchestrator::JsonLineLogger;

Event MakeEvent(std::string id, std::string message) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = EventSeverity::kWarning;
  event.event_id = std::move(id);
  event.message = std::move(message);
  return event;
}

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

void TestSubscribersAndPrivacy(const std::filesystem::path& dir,
                               const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  AuditLogOptions options;
  options.path = dir / "audit.log";
  options.key = std::vector<uint8_t>(32, 0x42);
  auto logger = std::make_shared<JsonLineLogger>(options, crypto);
  EventBus bus(logger);

  std::vector<std::string> seen;
  bus.Subscribe([&seen](const Event& event) { seen.push_back(event.event_id); });

  auto event = MakeEvent("preflight_rejected", "Code validation failed: Blocked module import: os");
  event.fields.emplace_back("subject_id", "null_check");
  event.fields.emplace_back("secret", "hunter2");
  event.fields.emplace_back("token", "abc", FieldPrivacy::kRedact);
  event.fields.emplace_back("issue_count", "1", FieldPrivacy::kPublic, true);
  bus.Publish(event);
  bus.Publish(MakeEvent("signer_added", "Added trusted signer: s1"));

  assert(seen.size() == 2);
  assert(seen[0] == "preflight_rejected");
  assert(logger->EntryCount() == 2);

  auto lines = ReadLines(options.path);
  assert(lines.size() == 2);
  assert(lines[0].find("\"event_id\":\"preflight_rejected\"") != std::string::npos);
  assert(lines[0].find("\"subject_id\":\"null_check\"") != std::string::npos);
  assert(lines[0].find("hunter2") == std::string::npos);
  assert(lines[0].find("\"token\":\"[REDACTED]\"") != std::string::npos);
  assert(lines[0].find("\"issue_count\":1") != std::string::npos);
  assert(lines[0].find("\"audit_seq\":1") != std::string::npos);
  assert(lines[1].find("\"audit_prev_count\":1") != std::string::npos);

  auto verified = warden::orchestrator::VerifyAuditLog(options.path, options.key, *crypto);
  assert(verified.ok);
  assert(verified.entries == 2);

  std::vector<uint8_t> wrong_key(32, 0x24);
  auto wrong = warden::orchestrator::VerifyAuditLog(options.path, wrong_key, *crypto);
  assert(!wrong.ok);
  assert(wrong.failed_line == 1);
}

void TestTamperDetection(const std::filesystem::path& dir,
                         const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  AuditLogOptions options;
  options.path = dir / "tamper.log";
  options.key = std::vector<uint8_t>(32, 0x11);
  {
    JsonLineLogger logger(options, crypto);
    logger.Log(MakeEvent("sandbox_execution_started", "first"));
    logger.Log(MakeEvent("sandbox_timeout", "second"));
    logger.Log(MakeEvent("execution_log_finalized", "third"));
  }

  auto lines = ReadLines(options.path);
  assert(lines.size() == 3);
  auto pos = lines[1].find("second");
  assert(pos != std::string::npos);
  lines[1].replace(pos, 6, "SECOND");
  std::ostringstream rewritten;
  for (const auto& line : lines) {
    rewritten << line << '\n';
  }
  warden::orchestrator::AtomicReplace(options.path, rewritten.str());

  auto verified = warden::orchestrator::VerifyAuditLog(options.path, options.key, *crypto);
  assert(!verified.ok);
  assert(verified.failed_line == 2);
  assert(!verified.error.empty());
}

void TestRotationRestartsChain(const std::filesystem::path& dir,
                               const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  AuditLogOptions options;
  options.path = dir / "rotating.log";
  options.key = std::vector<uint8_t>(32, 0x77);
  options.max_bytes = 600;
  options.max_files = 3;
  JsonLineLogger logger(options, crypto);
  for (int i = 0; i < 12; ++i) {
    logger.Log(MakeEvent("sandbox_execution_started", "execution " + std::to_string(i)));
  }

  assert(std::filesystem::exists(options.path));
  assert(std::filesystem::exists(options.path.string() + ".1"));
  assert(!std::filesystem::exists(options.path.string() + ".4"));

  auto current = warden::orchestrator::VerifyAuditLog(options.path, options.key, *crypto);
  assert(current.ok);
  auto rotated = warden::orchestrator::VerifyAuditLog(options.path.string() + ".1", options.key, *crypto);
  assert(rotated.ok);
}

void TestRandomKeyWhenUnconfigured(const std::filesystem::path& dir,
                                   const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  AuditLogOptions options;
  options.path = dir / "ephemeral.log";
  JsonLineLogger logger(options, crypto);
  logger.Log(MakeEvent("context_ready", "ready"));
  auto key = logger.key();
  assert(key.size() == warden::orchestrator::kAuditMacSize);
  auto verified = warden::orchestrator::VerifyAuditLog(options.path, key, *crypto);
  assert(verified.ok);
}

void TestSubscriberFailureIsContained() {
  EventBus bus;
  bus.Subscribe([](const Event&) { throw std::runtime_error("subscriber failed"); });
  warden::orchestrator::PublishSafely(bus, MakeEvent("cli_error", "boom"));

  bool threw = false;
  try {
    bus.Publish(MakeEvent("cli_error", "boom"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

}  // namespace

int main() {
  auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();
  warden::orchestrator::PrivateTempDir scratch("warden_event_bus_");

  TestSubscribersAndPrivacy(scratch.path(), crypto);
  TestTamperDetection(scratch.path(), crypto);
  TestRotationRestartsChain(scratch.path(), crypto);
  TestRandomKeyWhenUnconfigured(scratch.path(), crypto);
  TestSubscriberFailureIsContained();

  std::cout << "event bus tests ok\n";
  return 0;
}
