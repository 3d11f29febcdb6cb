#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/crypto/provider.h"
#include "warden/orchestrator/event_bus.h"

namespace warden::drivers {

enum class ExecutionStatus : uint8_t { kRunning, kCompleted, kFailed };

const char* ExecutionStatusToString(ExecutionStatus status);

// Random RFC 4122 version 4 identifier.
std::string NewExecutionId(crypto::CryptoProvider& crypto);

struct ExecutionLog {
  std::string execution_id;
  std::string plugin_id;
  std::string validator_id;
  std::string reporter_id;
  std::string source_id;
  ExecutionStatus status{ExecutionStatus::kRunning};
  std::string started_at;
  std::string completed_at;
  double duration_ms{0.0};
  nlohmann::json result;
  std::string error_message;
  double memory_used_mb{0.0};

  nlohmann::json ToJson() const;
};

// Persistence collaborator for execution logs. A log is created running and
// finalized exactly once.
class ExecutionLogStore {
public:
  virtual ~ExecutionLogStore() = default;

  virtual void Create(const ExecutionLog& log) = 0;
  virtual void Complete(std::string_view execution_id, const nlohmann::json& summary, double memory_used_mb) = 0;
  virtual void Fail(std::string_view execution_id, std::string_view error) = 0;
};

// Finalizing an unknown or already finalized log throws Error(State).
class InMemoryExecutionLogStore : public ExecutionLogStore {
public:
  explicit InMemoryExecutionLogStore(orchestrator::EventBus* bus = nullptr) : bus_(bus) {}

  void Create(const ExecutionLog& log) override;
  void Complete(std::string_view execution_id, const nlohmann::json& summary, double memory_used_mb) override;
  void Fail(std::string_view execution_id, std::string_view error) override;

  std::optional<ExecutionLog> Get(std::string_view execution_id) const;
  // Creation order.
  std::vector<ExecutionLog> List() const;
  size_t size() const;

private:
  struct Entry {
    ExecutionLog log;
    std::chrono::steady_clock::time_point started;
  };

  Entry& RunningLocked(std::string_view execution_id);
  void PublishFinalized(const ExecutionLog& log);

  orchestrator::EventBus* bus_;
  mutable std::mutex mutex_;
  std::vector<std::string> order_;
  std::unordered_map<std::string, Entry> entries_;
};

}  // namespace warden::drivers
