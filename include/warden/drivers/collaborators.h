#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "warden/orchestrator/event_bus.h"

namespace warden::drivers {

enum class UsageKind : uint8_t { kValidator, kReporter, kPlugin };

// Usage accounting for registered validators, reporters and plugins.
class UsageCounters {
public:
  virtual ~UsageCounters() = default;

  virtual void Increment(UsageKind kind, std::string_view id) = 0;
};

class InMemoryUsageCounters : public UsageCounters {
public:
  void Increment(UsageKind kind, std::string_view id) override;

  uint64_t Count(UsageKind kind, std::string_view id) const;

private:
  mutable std::mutex mutex_;
  std::array<std::unordered_map<std::string, uint64_t>, 3> counts_;
};

// Receives structured security events emitted by the drivers.
class AuditSink {
public:
  virtual ~AuditSink() = default;

  virtual void Record(const orchestrator::Event& event) noexcept = 0;
};

// Forwards to the bus with the category forced to security.
class EventBusAuditSink : public AuditSink {
public:
  explicit EventBusAuditSink(orchestrator::EventBus& bus) : bus_(bus) {}

  void Record(const orchestrator::Event& event) noexcept override;

private:
  orchestrator::EventBus& bus_;
};

}  // namespace warden::drivers
