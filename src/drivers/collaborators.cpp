#include "warden/drivers/collaborators.h"

#include <iostream>
#include <new>

namespace warden::drivers {

void InMemoryUsageCounters::Increment(UsageKind kind, std::string_view id) {
  std::lock_guard lock(mutex_);
  ++counts_[static_cast<size_t>(kind)][std::string(id)];
}

uint64_t InMemoryUsageCounters::Count(UsageKind kind, std::string_view id) const {
  std::lock_guard lock(mutex_);
  const auto& table = counts_[static_cast<size_t>(kind)];
  auto it = table.find(std::string(id));
  return it == table.end() ? 0 : it->second;
}

void EventBusAuditSink::Record(const orchestrator::Event& event) noexcept {
  try {
    auto copy = event;
    copy.category = orchestrator::EventCategory::kSecurity;
    orchestrator::PublishSafely(bus_, copy);
  } catch (const std::bad_alloc&) {
    std::clog << "{\"event\":\"audit_record_dropped\",\"event_id\":\"" << event.event_id << "\"}" << std::endl;
  }
}

}  // namespace warden::drivers
