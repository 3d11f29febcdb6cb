#include "warden/drivers/execution_log.h"

#include <array>

#include "warden/common.h"
#include "warden/error.h"

namespace warden::drivers {

const char* ExecutionStatusToString(ExecutionStatus status) {
  switch (status) {
  case ExecutionStatus::kRunning:
    return "running";
  case ExecutionStatus::kCompleted:
    return "completed";
  case ExecutionStatus::kFailed:
    return "failed";
  }
  return "running";
}

std::string NewExecutionId(crypto::CryptoProvider& crypto) {
  std::array<uint8_t, 16> bytes{};
  crypto.RandomBytes(bytes);
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3f) | 0x80);
  auto hex = crypto::HexEncode(bytes);
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
         hex.substr(20);
}

nlohmann::json ExecutionLog::ToJson() const {
  nlohmann::json out = {
      {"execution_id", execution_id},
      {"plugin_id", plugin_id},
      {"source_id", source_id},
      {"status", ExecutionStatusToString(status)},
      {"started_at", started_at},
      {"completed_at", completed_at.empty() ? nlohmann::json() : nlohmann::json(completed_at)},
      {"duration_ms", duration_ms},
      {"result", result},
      {"error_message", error_message.empty() ? nlohmann::json() : nlohmann::json(error_message)},
      {"memory_used_mb", memory_used_mb},
  };
  if (!validator_id.empty()) {
    out["validator_id"] = validator_id;
  }
  if (!reporter_id.empty()) {
    out["reporter_id"] = reporter_id;
  }
  return out;
}

void InMemoryExecutionLogStore::Create(const ExecutionLog& log) {
  std::lock_guard lock(mutex_);
  if (entries_.count(log.execution_id) != 0) {
    throw Error(ErrorDomain::State, errors::state::kLogAlreadyFinalized,
                "Execution log already exists: " + log.execution_id);
  }
  Entry entry{log, std::chrono::steady_clock::now()};
  entry.log.status = ExecutionStatus::kRunning;
  if (entry.log.started_at.empty()) {
    entry.log.started_at = FormatUtcTimestamp(std::chrono::system_clock::now());
  }
  order_.push_back(log.execution_id);
  entries_.emplace(log.execution_id, std::move(entry));
}

InMemoryExecutionLogStore::Entry& InMemoryExecutionLogStore::RunningLocked(std::string_view execution_id) {
  auto it = entries_.find(std::string(execution_id));
  if (it == entries_.end()) {
    throw Error(ErrorDomain::State, errors::state::kLogMissing,
                "Unknown execution log: " + std::string(execution_id));
  }
  if (it->second.log.status != ExecutionStatus::kRunning) {
    throw Error(ErrorDomain::State, errors::state::kLogAlreadyFinalized,
                "Execution log already finalized: " + std::string(execution_id));
  }
  auto& entry = it->second;
  entry.log.completed_at = FormatUtcTimestamp(std::chrono::system_clock::now());
  entry.log.duration_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - entry.started).count();
  return entry;
}

void InMemoryExecutionLogStore::PublishFinalized(const ExecutionLog& log) {
  if (!bus_) {
    return;
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = log.status == ExecutionStatus::kFailed ? orchestrator::EventSeverity::kWarning
                                                          : orchestrator::EventSeverity::kInfo;
  event.event_id = "execution_log_finalized";
  event.message = "Execution " + log.execution_id + " " + ExecutionStatusToString(log.status);
  event.fields.emplace_back("execution_id", log.execution_id);
  event.fields.emplace_back("plugin_id", log.plugin_id);
  event.fields.emplace_back("status", ExecutionStatusToString(log.status));
  event.fields.emplace_back("duration_ms", std::to_string(log.duration_ms), orchestrator::FieldPrivacy::kPublic,
                            true);
  orchestrator::PublishSafely(*bus_, event);
}

void InMemoryExecutionLogStore::Complete(std::string_view execution_id, const nlohmann::json& summary,
                                         double memory_used_mb) {
  ExecutionLog snapshot;
  {
    std::lock_guard lock(mutex_);
    auto& entry = RunningLocked(execution_id);
    entry.log.status = ExecutionStatus::kCompleted;
    entry.log.result = summary;
    entry.log.memory_used_mb = memory_used_mb;
    snapshot = entry.log;
  }
  PublishFinalized(snapshot);
}

void InMemoryExecutionLogStore::Fail(std::string_view execution_id, std::string_view error) {
  ExecutionLog snapshot;
  {
    std::lock_guard lock(mutex_);
    auto& entry = RunningLocked(execution_id);
    entry.log.status = ExecutionStatus::kFailed;
    entry.log.error_message = std::string(error);
    snapshot = entry.log;
  }
  PublishFinalized(snapshot);
}

std::optional<ExecutionLog> InMemoryExecutionLogStore::Get(std::string_view execution_id) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(std::string(execution_id));
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.log;
}

std::vector<ExecutionLog> InMemoryExecutionLogStore::List() const {
  std::lock_guard lock(mutex_);
  std::vector<ExecutionLog> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    out.push_back(entries_.at(id).log);
  }
  return out;
}

size_t InMemoryExecutionLogStore::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace warden::drivers
