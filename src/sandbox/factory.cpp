#include "warden/sandbox/factory.h"

#include "warden/sandbox/container_engine.h"
#include "warden/sandbox/process_engine.h"
#include "warden/sandbox/subprocess.h"

namespace warden::sandbox {

std::unique_ptr<SandboxEngine> CreateEngine(const SandboxConfig& config,
                                            const EngineDependencies& deps) {
  switch (config.isolation) {
  case IsolationLevel::kNone: {
    auto embedded = deps.embedded ? deps.embedded : std::make_shared<EmbeddedPython>();
    return std::make_unique<NoOpEngine>(config, std::move(embedded), deps.bus);
  }
  case IsolationLevel::kProcess:
    return std::make_unique<ProcessEngine>(config, deps.crypto, deps.bus);
  case IsolationLevel::kContainer:
    return std::make_unique<ContainerEngine>(config, deps.crypto, deps.bus);
  }
  return std::make_unique<ProcessEngine>(config, deps.crypto, deps.bus);
}

std::vector<EngineAvailability> AvailableEngines(const SandboxConfig& config) {
  std::vector<EngineAvailability> out;

  EngineAvailability none;
  none.isolation = IsolationLevel::kNone;
  none.available = true;
  none.runtime = "embedded";
  none.detail = "in-process interpreter, no isolation";
  out.push_back(std::move(none));

  EngineAvailability process;
  process.isolation = IsolationLevel::kProcess;
  if (auto python = ResolvePythonExecutable(config.python_executable)) {
    process.available = true;
    process.runtime = *python;
    process.detail = "fresh interpreter per execution with rlimits and seccomp";
  } else {
    process.detail = "python3 not found";
  }
  out.push_back(std::move(process));

  EngineAvailability container;
  container.isolation = IsolationLevel::kContainer;
  if (auto runtime = ProbeContainerRuntime(config.container_runtime)) {
    container.available = true;
    container.runtime = runtime->name;
    container.detail = runtime->version;
  } else {
    container.detail = "no container runtime found";
  }
  out.push_back(std::move(container));
  return out;
}

}  // namespace warden::sandbox
