#pragma once

#include <memory>
#include <string_view>

#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/engine.h"

namespace warden::sandbox {

// Owns the in-process interpreter for the lifetime of the Context. When the
// host already runs an interpreter it is reused and left alone on destruction.
// The GIL is released after start-up; callers re-acquire it per execution.
class EmbeddedPython {
public:
  EmbeddedPython();
  ~EmbeddedPython();

  EmbeddedPython(const EmbeddedPython&) = delete;
  EmbeddedPython& operator=(const EmbeddedPython&) = delete;

  bool owns_interpreter() const noexcept;

private:
  struct State;
  std::unique_ptr<State> state_;
};

// Runs trusted code inside the host process. No limits are applied.
class NoOpEngine : public SandboxEngine {
public:
  NoOpEngine(SandboxConfig config, std::shared_ptr<EmbeddedPython> runtime,
             orchestrator::EventBus* bus = nullptr);

  SandboxResult Execute(const ExecutionRequest& request) noexcept override;

  IsolationLevel isolation() const noexcept override { return IsolationLevel::kNone; }
  std::string_view name() const noexcept override { return "none"; }
  const SandboxConfig& config() const noexcept override { return config_; }

private:
  SandboxConfig config_;
  std::shared_ptr<EmbeddedPython> runtime_;
  orchestrator::EventBus* bus_;
};

}  // namespace warden::sandbox
