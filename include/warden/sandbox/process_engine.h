#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "warden/crypto/provider.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/engine.h"
#include "warden/sandbox/subprocess.h"

namespace warden::sandbox {

// Descriptors the interpreter needs on top of what plugin code may open.
inline constexpr uint32_t kInterpreterDescriptorReserve = 16;

ProcessLimits LimitsFor(const SandboxConfig& config);

// Turns a finished child into a SandboxResult. block_in_stdout selects the
// container layout where the result block shares stdout with user output.
SandboxResult ClassifyOutcome(const SpawnOutcome& outcome, std::string_view nonce,
                              const SandboxConfig& config, bool block_in_stdout);

// Runs each request in a fresh hardened interpreter process.
class ProcessEngine : public SandboxEngine {
public:
  ProcessEngine(SandboxConfig config, std::shared_ptr<crypto::CryptoProvider> crypto,
                orchestrator::EventBus* bus = nullptr);

  SandboxResult Execute(const ExecutionRequest& request) noexcept override;

  IsolationLevel isolation() const noexcept override { return IsolationLevel::kProcess; }
  std::string_view name() const noexcept override { return "process"; }
  const SandboxConfig& config() const noexcept override { return config_; }

  const std::optional<std::string>& python_executable() const noexcept { return python_; }

private:
  SandboxResult ExecuteUnchecked(const ExecutionRequest& request);

  SandboxConfig config_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  orchestrator::EventBus* bus_;
  std::optional<std::string> python_;
};

}  // namespace warden::sandbox
