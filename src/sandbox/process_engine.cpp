#include "warden/sandbox/process_engine.h"

#include <csignal>
#include <cstdio>
#include <cstring>
#include <iostream>

#include "warden/errors.h"
#include "warden/sandbox/runner.h"

namespace warden::sandbox {

namespace {

constexpr uint64_t kMiB = 1024ull * 1024ull;

std::string FormatSeconds(double ms) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.2fs", ms / 1000.0);
  return buffer;
}

void Publish(orchestrator::EventBus* bus, orchestrator::EventSeverity severity,
             std::string event_id, std::string message, std::vector<orchestrator::EventField> fields) {
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

}  // namespace

ProcessLimits LimitsFor(const SandboxConfig& config) {
  ProcessLimits limits;
  limits.address_space_bytes = static_cast<uint64_t>(config.memory_limit_mb) * kMiB;
  limits.cpu_seconds = config.cpu_time_limit_sec;
  limits.file_size_bytes = static_cast<uint64_t>(config.max_file_size_mb) * kMiB;
  limits.open_files = static_cast<uint64_t>(config.max_open_files) + kInterpreterDescriptorReserve;
  limits.processes = config.max_processes;
  limits.deny_network = !config.allow_network;
  limits.restrict_exec = true;
  limits.deny_filesystem_writes = !config.allow_filesystem;
  return limits;
}

SandboxResult ClassifyOutcome(const SpawnOutcome& outcome, std::string_view nonce,
                              const SandboxConfig& config, bool block_in_stdout) {
  SandboxResult out;
  out.execution_time_ms = outcome.elapsed_ms;
  out.memory_used_mb = outcome.max_rss_mb;
  out.exit_code = outcome.StatusCode();

  if (outcome.exec_errno != 0) {
    out = SandboxResult::Failure(FailureKind::kRuntimeUnavailable, "RuntimeUnavailable",
                                 std::string("Failed to start interpreter: ") +
                                     std::strerror(outcome.exec_errno));
    out.execution_time_ms = outcome.elapsed_ms;
    out.exit_code = 127;
    return out;
  }

  if (outcome.timed_out) {
    // Partial output was discarded by RunProcess.
    out.failure = FailureKind::kResourceExceeded;
    out.error_type = "timeout";
    out.exit_code = -SIGKILL;
    out.error = "Execution timed out after " + FormatSeconds(outcome.elapsed_ms) + " (limit " +
                std::to_string(config.wall_time_limit_sec) + "s)";
    return out;
  }

  const std::string& channel = block_in_stdout ? outcome.stdout_data : outcome.result_data;
  auto block = ExtractResultBlock(channel, nonce);
  out.stdout_text = block_in_stdout ? block.remainder : outcome.stdout_data;
  out.stderr_text = outcome.stderr_data;

  bool runner_truncated = false;
  if (block.status == BlockStatus::kFound && block.payload.contains("stdout_truncated")) {
    runner_truncated = block.payload["stdout_truncated"].is_boolean() &&
                       block.payload["stdout_truncated"].get<bool>();
  }
  TruncateOutput(out.stdout_text, config.max_output_bytes,
                 runner_truncated || (!block_in_stdout && outcome.stdout_truncated));
  TruncateOutput(out.stderr_text, config.max_output_bytes, outcome.stderr_truncated);

  // SIGKILL with the CPU budget spent means the hard limit fired after SIGXCPU
  // was ignored or arrived too late to be reported.
  const bool cpu_exhausted =
      outcome.term_signal == SIGXCPU ||
      (outcome.term_signal == SIGKILL && config.cpu_time_limit_sec > 0 &&
       outcome.cpu_seconds >= static_cast<double>(config.cpu_time_limit_sec));
  if (!outcome.exited && cpu_exhausted) {
    out.success = false;
    out.failure = FailureKind::kResourceExceeded;
    out.error_type = "ResourceExceeded";
    out.error = std::string(errors::msg::kCpuLimitExceeded) + " (limit " +
                std::to_string(config.cpu_time_limit_sec) + "s)";
    return out;
  }

  switch (block.status) {
  case BlockStatus::kFound:
    ApplyRunnerPayload(block.payload, out);
    return out;
  case BlockStatus::kMalformed:
    out.success = false;
    out.failure = FailureKind::kProtocolFailure;
    out.error_type = "ParseError";
    out.error = "Failed to parse result: " + block.error;
    return out;
  case BlockStatus::kMissing:
    break;
  }

  out.success = false;
  if (!block_in_stdout && outcome.result_truncated) {
    out.failure = FailureKind::kResourceExceeded;
    out.error_type = "ResourceExceeded";
    out.error = std::string(errors::msg::kResultTooLarge);
  } else if (!outcome.exited) {
    out.failure = FailureKind::kExecutionFailure;
    out.error_type = "ProcessError";
    out.error = "Process terminated by signal " + std::to_string(outcome.term_signal);
  } else if (outcome.exit_code != 0) {
    out.failure = FailureKind::kExecutionFailure;
    out.error_type = "ProcessError";
    out.error = "Process exited with code " + std::to_string(outcome.exit_code);
  } else {
    out.failure = FailureKind::kProtocolFailure;
    out.error_type = "ProtocolError";
    out.error = std::string(errors::msg::kNoResultProduced);
  }
  return out;
}

ProcessEngine::ProcessEngine(SandboxConfig config, std::shared_ptr<crypto::CryptoProvider> crypto,
                             orchestrator::EventBus* bus)
    : config_(std::move(config)),
      crypto_(crypto ? std::move(crypto) : crypto::MakeOpenSSLCryptoProvider()),
      bus_(bus),
      python_(ResolvePythonExecutable(config_.python_executable)) {}

SandboxResult ProcessEngine::Execute(const ExecutionRequest& request) noexcept {
  try {
    auto result = ExecuteUnchecked(request);
    EnsureFailureDetails(result);
    return result;
  } catch (const std::exception& ex) {
    return SandboxResult::Failure(FailureKind::kExecutionFailure, "SandboxError", ex.what());
  }
}

SandboxResult ProcessEngine::ExecuteUnchecked(const ExecutionRequest& request) {
  if (!python_) {
    Publish(bus_, orchestrator::EventSeverity::kWarning, "sandbox_runtime_unavailable",
            "No python3 interpreter found", {{"engine", "process"}});
    return SandboxResult::Failure(FailureKind::kRuntimeUnavailable, "RuntimeUnavailable",
                                  "python3 interpreter not found");
  }

  const auto nonce = crypto::RandomHex(*crypto_, 16);

  SpawnOptions options;
  options.executable = *python_;
  options.argv = {*python_, "-I", "-S", "-B", "-c", std::string(RunnerScript()),
                  "--result-fd", "3"};
  options.environment = SanitizedEnvironment();
  options.stdin_data = BuildRunnerRequest(config_, request, nonce).dump();
  options.result_channel = true;
  options.limits = LimitsFor(config_);
  options.timeout = std::chrono::seconds(config_.wall_time_limit_sec);
  options.max_capture_bytes = config_.max_output_bytes;

  Publish(bus_, orchestrator::EventSeverity::kDebug, "sandbox_execution_started",
          "Starting sandboxed execution",
          {{"engine", "process"},
           {"code_sha256", request.code, orchestrator::FieldPrivacy::kHash},
           {"wall_limit_sec", std::to_string(config_.wall_time_limit_sec),
            orchestrator::FieldPrivacy::kPublic, true}});

  auto outcome = RunProcess(options);
  auto result = ClassifyOutcome(outcome, nonce, config_, false);

  if (outcome.timed_out) {
    Publish(bus_, orchestrator::EventSeverity::kWarning, "sandbox_timeout", result.error,
            {{"engine", "process"},
             {"elapsed_ms", std::to_string(static_cast<uint64_t>(outcome.elapsed_ms)),
              orchestrator::FieldPrivacy::kPublic, true}});
  } else if (result.error_type == "ParseError") {
    Publish(bus_, orchestrator::EventSeverity::kError, "sandbox_result_malformed", result.error,
            {{"engine", "process"}});
  }
  return result;
}

}  // namespace warden::sandbox
