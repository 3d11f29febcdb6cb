#include "warden/orchestrator/config.h"

#include <cstdlib>

#include "warden/common.h"
#include "warden/error.h"
#include "warden/orchestrator/io_util.h"

namespace warden::orchestrator {

namespace {

constexpr std::string_view kOverridePrefix = "override.";

[[noreturn]] void ThrowLineError(int code, size_t line_number, const std::string& detail) {
  throw Error(ErrorDomain::Config, code, "config line " + std::to_string(line_number) + ": " + detail);
}

size_t RequireSize(std::string_view key, std::string_view value, size_t line_number) {
  auto parsed = ParseUint64(value);
  if (!parsed) {
    ThrowLineError(errors::config::kInvalidValue, line_number,
                   std::string(key) + " expects a non-negative integer");
  }
  return static_cast<size_t>(*parsed);
}

}  // namespace

trust::SecurityPolicy WardenConfig::ResolvePolicy() const {
  auto resolved = trust::ApplyOverrides(trust::GetPreset(policy), overrides);
  if (!container_fail_closed) {
    resolved.require_container = false;
  }
  for (const auto& module : blocked_modules) {
    resolved.blocked_modules.push_back(module);
  }
  return resolved;
}

sandbox::SandboxConfig WardenConfig::ResolveSandboxConfig(const trust::SecurityPolicy& resolved) const {
  sandbox::SandboxConfig base;
  base.python_executable = python;
  base.container_runtime = container_runtime;
  base.container_image = container_image;
  base.max_output_bytes = max_output_bytes;
  return resolved.ToSandboxConfig(base);
}

WardenConfig ParseConfig(std::string_view text) {
  WardenConfig config;
  size_t line_number = 0;
  while (!text.empty()) {
    auto newline = text.find('\n');
    auto raw = text.substr(0, newline);
    text.remove_prefix(newline == std::string_view::npos ? text.size() : newline + 1);
    ++line_number;

    auto view = Trim(raw);
    if (view.empty() || view.front() == '#') {
      continue;
    }
    auto equals = view.find('=');
    if (equals == std::string_view::npos) {
      ThrowLineError(errors::config::kMalformedLine, line_number, "expected key=value");
    }
    auto key = Trim(view.substr(0, equals));
    auto value = Trim(view.substr(equals + 1));

    if (key == "policy") {
      config.policy = std::string(value);
      try {
        (void)trust::GetPreset(value);
      } catch (const Error& err) {
        ThrowLineError(err.code, line_number, err.what());
      }
    } else if (key == "python") {
      config.python = std::string(value);
    } else if (key == "container_runtime") {
      if (value != "auto" && value != "docker" && value != "podman" && value != "none") {
        ThrowLineError(errors::config::kInvalidValue, line_number,
                       "container_runtime must be auto, docker, podman or none");
      }
      config.container_runtime = std::string(value);
    } else if (key == "container_image") {
      config.container_image = std::string(value);
    } else if (key == "container_fail_closed") {
      auto parsed = ParseBool(value);
      if (!parsed) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "container_fail_closed expects a boolean");
      }
      config.container_fail_closed = *parsed;
    } else if (key == "audit_log") {
      config.audit_log = std::filesystem::path(std::string(value));
    } else if (key == "audit_log_max_bytes") {
      config.audit_log_max_bytes = RequireSize(key, value, line_number);
    } else if (key == "audit_key") {
      auto decoded = crypto::HexDecode(value);
      if (!decoded || decoded->empty()) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "audit_key must be hex");
      }
      config.audit_key = std::move(*decoded);
    } else if (key == "trust_store") {
      config.trust_store = std::filesystem::path(std::string(value));
    } else if (key == "analysis_cache_entries") {
      config.analysis_cache_entries = RequireSize(key, value, line_number);
    } else if (key == "max_output_bytes") {
      config.max_output_bytes = RequireSize(key, value, line_number);
    } else if (key == "blocked_module") {
      if (value.empty()) {
        ThrowLineError(errors::config::kInvalidValue, line_number, "blocked_module needs a module name");
      }
      config.blocked_modules.emplace_back(value);
    } else if (key.substr(0, kOverridePrefix.size()) == kOverridePrefix) {
      try {
        config.overrides.Set(key.substr(kOverridePrefix.size()), value);
      } catch (const Error& err) {
        ThrowLineError(err.code, line_number, err.what());
      }
    } else {
      ThrowLineError(errors::config::kUnknownKey, line_number, "unknown key '" + std::string(key) + "'");
    }
  }
  return config;
}

WardenConfig LoadConfig(const std::filesystem::path& path) {
  return ParseConfig(ReadTextFile(path));
}

WardenConfig LoadConfigFromEnvironment(const std::optional<std::filesystem::path>& explicit_path) {
  WardenConfig config;
  if (explicit_path) {
    config = LoadConfig(*explicit_path);
  } else if (const char* env = std::getenv(kConfigEnv); env && *env) {
    config = LoadConfig(env);
  }

  if (const char* python = std::getenv(kPythonEnv); python && *python) {
    config.python = python;
  }
  if (const char* max_size = std::getenv(kAuditLogMaxSizeEnv); max_size && *max_size) {
    auto parsed = ParseUint64(max_size);
    if (!parsed || *parsed == 0) {
      throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                  std::string(kAuditLogMaxSizeEnv) + " must be a positive integer");
    }
    config.audit_log_max_bytes = static_cast<size_t>(*parsed);
  }
  return config;
}

}  // namespace warden::orchestrator
