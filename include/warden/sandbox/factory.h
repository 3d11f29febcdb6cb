#pragma once

#include <memory>
#include <string>
#include <vector>

#include "warden/crypto/provider.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/engine.h"
#include "warden/sandbox/noop_engine.h"

namespace warden::sandbox {

// Shared collaborators handed to every engine the factory builds.
struct EngineDependencies {
  std::shared_ptr<crypto::CryptoProvider> crypto;
  orchestrator::EventBus* bus{nullptr};
  // Required for IsolationLevel::kNone; started lazily when absent.
  std::shared_ptr<EmbeddedPython> embedded;
};

std::unique_ptr<SandboxEngine> CreateEngine(const SandboxConfig& config,
                                            const EngineDependencies& deps);

struct EngineAvailability {
  IsolationLevel isolation{IsolationLevel::kNone};
  bool available{false};
  std::string runtime;
  std::string detail;
};

// One entry each for none, process and container.
std::vector<EngineAvailability> AvailableEngines(const SandboxConfig& config);

}  // namespace warden::sandbox
