#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/crypto/provider.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/engine.h"
#include "warden/sandbox/process_engine.h"

namespace warden::sandbox {

struct ContainerRuntime {
  std::string name;
  std::string path;
  std::string version;
};

// Probes docker then podman with "<tool> --version". A preference of docker or
// podman is tried first; "none" disables probing.
std::optional<ContainerRuntime> ProbeContainerRuntime(std::string_view preference);

// Runs each request in a throw-away container with the sandbox directory
// mounted read-only at /sandbox.
class ContainerEngine : public SandboxEngine {
public:
  ContainerEngine(SandboxConfig config, std::shared_ptr<crypto::CryptoProvider> crypto,
                  orchestrator::EventBus* bus = nullptr);

  // Uses a pre-probed runtime; nullopt means no runtime is available.
  ContainerEngine(SandboxConfig config, std::optional<ContainerRuntime> runtime,
                  std::shared_ptr<crypto::CryptoProvider> crypto, orchestrator::EventBus* bus = nullptr);

  SandboxResult Execute(const ExecutionRequest& request) noexcept override;

  IsolationLevel isolation() const noexcept override { return IsolationLevel::kContainer; }
  std::string_view name() const noexcept override { return "container"; }
  const SandboxConfig& config() const noexcept override { return config_; }

  const std::optional<ContainerRuntime>& runtime() const noexcept { return runtime_; }
  bool falls_back() const noexcept { return fallback_ != nullptr; }

  // Full argv for one run, starting with the runtime executable.
  std::vector<std::string> BuildRunCommand(const std::filesystem::path& sandbox_dir,
                                           std::string_view container_name) const;

private:
  SandboxResult RunInContainer(const ExecutionRequest& request);

  SandboxConfig config_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  orchestrator::EventBus* bus_;
  std::optional<ContainerRuntime> runtime_;
  std::unique_ptr<ProcessEngine> fallback_;
};

}  // namespace warden::sandbox
