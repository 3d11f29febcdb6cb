#include "warden/sandbox/container_engine.h"

#include <algorithm>
#include <iostream>

#include "warden/common.h"
#include "warden/error.h"
#include "warden/errors.h"
#include "warden/orchestrator/io_util.h"
#include "warden/sandbox/runner.h"
#include "warden/sandbox/subprocess.h"

namespace fs = std::filesystem;

namespace warden::sandbox {

namespace {

constexpr auto kProbeTimeout = std::chrono::seconds(10);
constexpr auto kKillTimeout = std::chrono::seconds(10);
constexpr size_t kMaxBlockBytes = 8 * 1024 * 1024;
constexpr const char* kMountPoint = "/sandbox";
constexpr const char* kUnprivilegedUser = "65534:65534";

std::optional<ContainerRuntime> ProbeTool(const std::string& tool) {
  auto path = FindExecutable(tool);
  if (!path) {
    return std::nullopt;
  }
  SpawnOptions probe;
  probe.executable = *path;
  probe.argv = {*path, "--version"};
  probe.environment = SanitizedEnvironment();
  probe.timeout = kProbeTimeout;
  probe.max_capture_bytes = 4096;
  try {
    auto outcome = RunProcess(probe);
    if (!outcome.exited || outcome.exit_code != 0) {
      return std::nullopt;
    }
    return ContainerRuntime{tool, *path, std::string(Trim(outcome.stdout_data))};
  } catch (const Error& err) {
    std::clog << "{\"event\":\"container_probe_failed\",\"runtime\":\"" << tool << "\",\"error\":\""
              << err.what() << "\"}" << std::endl;
    return std::nullopt;
  }
}

void Publish(orchestrator::EventBus* bus, orchestrator::EventSeverity severity, std::string event_id,
             std::string message, std::vector<orchestrator::EventField> fields) {
  if (bus == nullptr) {
    return;
  }
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = std::move(event_id);
  event.message = std::move(message);
  event.fields = std::move(fields);
  orchestrator::PublishSafely(*bus, event);
}

bool IsRuntimeExit(int code) { return code == 125 || code == 126 || code == 127; }

// Makes a file written by AtomicReplace readable by the unprivileged container user.
void ShareReadOnly(const fs::path& path, fs::perms perms) {
  std::error_code ec;
  fs::permissions(path, perms, fs::perm_options::replace, ec);
  if (ec) {
    throw Error(ErrorDomain::IO, errors::io::kTempDirFailed,
                "Failed to set permissions on " + path.string() + ": " + ec.message(), ec.value());
  }
}

}  // namespace

std::optional<ContainerRuntime> ProbeContainerRuntime(std::string_view preference) {
  if (preference == "none") {
    return std::nullopt;
  }
  std::vector<std::string> order;
  if (preference == "docker" || preference == "podman") {
    order.emplace_back(preference);
  }
  for (const char* tool : {"docker", "podman"}) {
    if (order.empty() || order.front() != tool) {
      order.emplace_back(tool);
    }
  }
  for (const auto& tool : order) {
    if (auto runtime = ProbeTool(tool)) {
      return runtime;
    }
  }
  return std::nullopt;
}

ContainerEngine::ContainerEngine(SandboxConfig config, std::shared_ptr<crypto::CryptoProvider> crypto,
                                 orchestrator::EventBus* bus)
    : ContainerEngine(config, ProbeContainerRuntime(config.container_runtime), std::move(crypto), bus) {}

ContainerEngine::ContainerEngine(SandboxConfig config, std::optional<ContainerRuntime> runtime,
                                 std::shared_ptr<crypto::CryptoProvider> crypto,
                                 orchestrator::EventBus* bus)
    : config_(std::move(config)),
      crypto_(crypto ? std::move(crypto) : crypto::MakeOpenSSLCryptoProvider()),
      bus_(bus),
      runtime_(std::move(runtime)) {
  if (runtime_) {
    return;
  }
  if (config_.require_container) {
    Publish(bus_, orchestrator::EventSeverity::kError, "sandbox_runtime_unavailable",
            std::string(errors::msg::kRuntimeUnavailable), {{"engine", "container"}, {"fail_closed", "true"}});
    return;
  }
  auto process_config = config_;
  process_config.isolation = IsolationLevel::kProcess;
  fallback_ = std::make_unique<ProcessEngine>(std::move(process_config), crypto_, bus_);
  Publish(bus_, orchestrator::EventSeverity::kWarning, "sandbox_runtime_unavailable",
          std::string(errors::msg::kRuntimeFallback), {{"engine", "container"}, {"fail_closed", "false"}});
}

std::vector<std::string> ContainerEngine::BuildRunCommand(const fs::path& sandbox_dir,
                                                          std::string_view container_name) const {
  const auto memory = std::to_string(config_.memory_limit_mb) + "m";
  const auto files = std::to_string(config_.max_open_files + kInterpreterDescriptorReserve);
  const auto processes = std::max<uint32_t>(config_.max_processes, 1);
  std::vector<std::string> argv = {
      runtime_ ? runtime_->path : std::string("docker"),
      "run",
      "--rm",
      "--name",
      std::string(container_name),
      "--memory=" + memory,
      "--memory-swap=" + memory,
      "--cpus=" + std::to_string(processes),
      "--pids-limit=" + std::to_string(processes * 10),
      "--ulimit",
      "nofile=" + files + ":" + files,
      "--read-only",
      "--tmpfs",
      "/tmp:rw,noexec,nosuid,size=16m",
      "--security-opt",
      "no-new-privileges",
      "--cap-drop",
      "ALL",
      "--network",
      config_.allow_network ? "bridge" : "none",
      "--user",
      kUnprivilegedUser,
      "-v",
      sandbox_dir.string() + ":" + kMountPoint + ":ro",
      config_.container_image,
      "python3",
      "-I",
      "-S",
      "-B",
      std::string(kMountPoint) + "/runner.py",
      std::string(kMountPoint) + "/request.json",
  };
  return argv;
}

SandboxResult ContainerEngine::Execute(const ExecutionRequest& request) noexcept {
  try {
    if (fallback_) {
      auto result = fallback_->Execute(request);
      result.warnings.emplace_back(errors::msg::kRuntimeFallback);
      return result;
    }
    if (!runtime_) {
      return SandboxResult::Failure(FailureKind::kRuntimeUnavailable, "RuntimeUnavailable",
                                    std::string(errors::msg::kRuntimeUnavailable));
    }
    auto result = RunInContainer(request);
    EnsureFailureDetails(result);
    return result;
  } catch (const std::exception& ex) {
    return SandboxResult::Failure(FailureKind::kExecutionFailure, "SandboxError", ex.what());
  }
}

SandboxResult ContainerEngine::RunInContainer(const ExecutionRequest& request) {
  const auto nonce = crypto::RandomHex(*crypto_, 16);
  const auto container_name = "warden-sandbox-" + nonce;

  orchestrator::PrivateTempDir dir("warden-sandbox");
  const auto runner_path = dir.path() / "runner.py";
  const auto request_path = dir.path() / "request.json";
  orchestrator::AtomicReplace(runner_path, RunnerScript());
  orchestrator::AtomicReplace(request_path, BuildRunnerRequest(config_, request, nonce).dump());
  const auto readable = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read |
                        fs::perms::others_read;
  ShareReadOnly(runner_path, readable);
  ShareReadOnly(request_path, readable);
  ShareReadOnly(dir.path(), readable | fs::perms::owner_exec | fs::perms::group_exec |
                                fs::perms::others_exec);

  SpawnOptions options;
  options.argv = BuildRunCommand(dir.path(), container_name);
  options.executable = options.argv.front();
  options.environment = SanitizedEnvironment();
  options.timeout = std::chrono::seconds(config_.wall_time_limit_sec);
  options.max_capture_bytes = config_.max_output_bytes + kMaxBlockBytes;
  const auto runtime_path = runtime_->path;
  options.on_timeout = [runtime_path, container_name]() {
    SpawnOptions kill;
    kill.executable = runtime_path;
    kill.argv = {runtime_path, "kill", container_name};
    kill.environment = SanitizedEnvironment();
    kill.timeout = kKillTimeout;
    try {
      (void)RunProcess(kill);
    } catch (const Error& err) {
      std::clog << "{\"event\":\"container_kill_failed\",\"container\":\"" << container_name
                << "\",\"error\":\"" << err.what() << "\"}" << std::endl;
    }
  };

  Publish(bus_, orchestrator::EventSeverity::kDebug, "sandbox_execution_started",
          "Starting container execution",
          {{"engine", "container"},
           {"runtime", runtime_->name},
           {"container", container_name},
           {"code_sha256", request.code, orchestrator::FieldPrivacy::kHash}});

  auto outcome = RunProcess(options);
  auto result = ClassifyOutcome(outcome, nonce, config_, true);

  if (outcome.timed_out) {
    Publish(bus_, orchestrator::EventSeverity::kWarning, "sandbox_timeout", result.error,
            {{"engine", "container"}, {"container", container_name}});
    return result;
  }
  if (!result.success && result.error_type == "ProcessError" && outcome.exited) {
    if (IsRuntimeExit(outcome.exit_code)) {
      auto detail = std::string(Trim(outcome.stderr_data.substr(0, outcome.stderr_data.find('\n'))));
      result.error_type = "ContainerError";
      result.error = "Container runtime failed with exit code " + std::to_string(outcome.exit_code);
      if (!detail.empty()) {
        result.error += ": " + detail;
      }
    } else if (outcome.exit_code == 137) {
      // Killed by the cgroup OOM killer before the runner could report.
      result.failure = FailureKind::kResourceExceeded;
      result.error_type = "MemoryError";
      result.error = "Memory limit exceeded (limit " + std::to_string(config_.memory_limit_mb) + " MB)";
    }
  } else if (result.error_type == "ParseError") {
    Publish(bus_, orchestrator::EventSeverity::kError, "sandbox_result_malformed", result.error,
            {{"engine", "container"}});
  }
  return result;
}

}  // namespace warden::sandbox
