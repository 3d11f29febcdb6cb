#include "warden/trust/policy.h"

#include <algorithm>

#include "warden/common.h"
#include "warden/error.h"
#include "warden/errors.h"
#include "warden/trust/security_analyzer.h"

namespace warden::trust {

namespace {

using sandbox::IsolationLevel;

struct PresetLimits {
  uint32_t memory_mb;
  uint32_t cpu_sec;
  uint32_t wall_sec;
  uint32_t file_mb;
  uint32_t open_files;
  uint32_t processes;
};

SecurityPolicy MakePreset(const char* name, const char* description, IsolationLevel isolation,
                          PresetLimits limits, bool open_access, uint32_t min_signatures,
                          std::vector<std::string> blocked_modules, bool require_container) {
  SecurityPolicy policy;
  policy.name = name;
  policy.description = description;
  policy.isolation = isolation;
  policy.memory_limit_mb = limits.memory_mb;
  policy.cpu_time_limit_sec = limits.cpu_sec;
  policy.wall_time_limit_sec = limits.wall_sec;
  policy.max_file_size_mb = limits.file_mb;
  policy.max_open_files = limits.open_files;
  policy.max_processes = limits.processes;
  policy.allow_network = open_access;
  policy.allow_filesystem = open_access;
  policy.require_signature = min_signatures > 0;
  policy.min_signatures = min_signatures;
  policy.blocked_modules = std::move(blocked_modules);
  policy.require_container = require_container;
  return policy;
}

std::vector<std::string> Extend(std::vector<std::string> base, std::initializer_list<const char*> extra) {
  for (const char* module : extra) {
    base.emplace_back(module);
  }
  return base;
}

const std::vector<SecurityPolicy>& Presets() {
  static const std::vector<SecurityPolicy> presets = [] {
    const auto standard_blocked = sandbox::DefaultBlockedModules();
    const auto enterprise_blocked = Extend(standard_blocked, {"builtins", "__builtin__"});
    const auto strict_blocked = Extend(enterprise_blocked, {"code", "codeop", "gc", "inspect", "traceback"});
    const auto airgapped_blocked = Extend(strict_blocked, {"ast", "dis", "types", "typing", "io", "tempfile"});

    std::vector<SecurityPolicy> out;
    out.push_back(MakePreset("development", "Development mode with minimal restrictions", IsolationLevel::kNone,
                             {1024, 300, 600, 100, 100, 10}, true, 0, {}, false));
    out.push_back(MakePreset("testing", "Testing mode with relaxed restrictions", IsolationLevel::kNone,
                             {512, 120, 300, 50, 50, 5}, true, 0, {}, false));
    out.push_back(MakePreset("standard", "Standard production security", IsolationLevel::kProcess,
                             {256, 30, 60, 10, 10, 1}, false, 1, standard_blocked, false));
    out.push_back(MakePreset("enterprise", "Enterprise security with signature requirements",
                             IsolationLevel::kProcess, {256, 30, 60, 10, 10, 1}, false, 1, enterprise_blocked,
                             false));
    out.push_back(MakePreset("strict", "High security environment with container isolation",
                             IsolationLevel::kContainer, {128, 15, 30, 5, 5, 1}, false, 2, strict_blocked, true));
    out.push_back(MakePreset("airgapped", "Air-gapped environment with maximum restrictions",
                             IsolationLevel::kContainer, {64, 10, 20, 1, 3, 1}, false, 2, airgapped_blocked, true));
    return out;
  }();
  return presets;
}

uint32_t ParseCount(std::string_view field, std::string_view value) {
  auto parsed = ParseUint64(value);
  if (!parsed || *parsed > UINT32_MAX) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Invalid value for " + std::string(field) + ": " + std::string(value));
  }
  return static_cast<uint32_t>(*parsed);
}

bool ParseSwitch(std::string_view field, std::string_view value) {
  auto parsed = ParseBool(value);
  if (!parsed) {
    throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                "Invalid value for " + std::string(field) + ": " + std::string(value));
  }
  return *parsed;
}

}  // namespace

sandbox::SandboxConfig SecurityPolicy::ToSandboxConfig(const sandbox::SandboxConfig& base) const {
  sandbox::SandboxConfig config = base;
  config.isolation = isolation;
  config.memory_limit_mb = memory_limit_mb;
  config.cpu_time_limit_sec = cpu_time_limit_sec;
  config.wall_time_limit_sec = wall_time_limit_sec;
  config.max_file_size_mb = max_file_size_mb;
  config.max_open_files = max_open_files;
  config.max_processes = max_processes;
  config.allow_network = allow_network;
  config.allow_filesystem = allow_filesystem;
  config.require_container = require_container;
  for (const auto& module : blocked_modules) {
    if (std::find(config.blocked_modules.begin(), config.blocked_modules.end(), module) ==
        config.blocked_modules.end()) {
      config.blocked_modules.push_back(module);
    }
  }
  return config;
}

nlohmann::json SecurityPolicy::ToJson() const {
  return {
      {"name", name},
      {"description", description},
      {"isolation_level", sandbox::IsolationToString(isolation)},
      {"resource_limits",
       {
           {"max_memory_mb", memory_limit_mb},
           {"max_cpu_time_sec", cpu_time_limit_sec},
           {"max_wall_time_sec", wall_time_limit_sec},
           {"max_file_size_mb", max_file_size_mb},
           {"max_open_files", max_open_files},
           {"max_processes", max_processes},
           {"network_enabled", allow_network},
           {"filesystem_enabled", allow_filesystem},
       }},
      {"require_signature", require_signature},
      {"min_signatures", min_signatures},
      {"allowed_signers", allowed_signers},
      {"blocked_modules", blocked_modules},
      {"allowed_permissions", allowed_permissions},
      {"require_container", require_container},
  };
}

void PolicyOverrides::Set(std::string_view field, std::string_view value) {
  field = Trim(field);
  value = Trim(value);
  if (field == "isolation") {
    auto level = sandbox::ParseIsolation(value);
    if (!level) {
      throw Error(ErrorDomain::Config, errors::config::kInvalidValue,
                  "Invalid isolation level: " + std::string(value));
    }
    isolation = *level;
  } else if (field == "memory_limit_mb") {
    memory_limit_mb = ParseCount(field, value);
  } else if (field == "cpu_time_limit_sec") {
    cpu_time_limit_sec = ParseCount(field, value);
  } else if (field == "wall_time_limit_sec") {
    wall_time_limit_sec = ParseCount(field, value);
  } else if (field == "max_file_size_mb") {
    max_file_size_mb = ParseCount(field, value);
  } else if (field == "max_open_files") {
    max_open_files = ParseCount(field, value);
  } else if (field == "max_processes") {
    max_processes = ParseCount(field, value);
  } else if (field == "allow_network") {
    allow_network = ParseSwitch(field, value);
  } else if (field == "allow_filesystem") {
    allow_filesystem = ParseSwitch(field, value);
  } else if (field == "require_signature") {
    require_signature = ParseSwitch(field, value);
  } else if (field == "min_signatures") {
    min_signatures = ParseCount(field, value);
  } else if (field == "require_container") {
    require_container = ParseSwitch(field, value);
  } else if (field == "allowed_signers") {
    allowed_signers = SplitList(value);
  } else if (field == "blocked_modules") {
    blocked_modules = SplitList(value);
  } else if (field == "allowed_permissions") {
    allowed_permissions = SplitList(value);
  } else {
    throw Error(ErrorDomain::Config, errors::config::kUnknownKey, "Unknown policy field: " + std::string(field));
  }
}

const std::vector<std::string>& PresetNames() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& preset : Presets()) {
      out.push_back(preset.name);
    }
    return out;
  }();
  return names;
}

SecurityPolicy GetPreset(std::string_view name) {
  const auto trimmed = Trim(name);
  for (const auto& preset : Presets()) {
    if (preset.name == trimmed) {
      return preset;
    }
  }
  throw Error(ErrorDomain::Config, errors::config::kUnknownPreset, "Unknown security preset: " + std::string(name));
}

SecurityPolicy ApplyOverrides(SecurityPolicy policy, const PolicyOverrides& overrides) {
  if (overrides.isolation) policy.isolation = *overrides.isolation;
  if (overrides.memory_limit_mb) policy.memory_limit_mb = *overrides.memory_limit_mb;
  if (overrides.cpu_time_limit_sec) policy.cpu_time_limit_sec = *overrides.cpu_time_limit_sec;
  if (overrides.wall_time_limit_sec) policy.wall_time_limit_sec = *overrides.wall_time_limit_sec;
  if (overrides.max_file_size_mb) policy.max_file_size_mb = *overrides.max_file_size_mb;
  if (overrides.max_open_files) policy.max_open_files = *overrides.max_open_files;
  if (overrides.max_processes) policy.max_processes = *overrides.max_processes;
  if (overrides.allow_network) policy.allow_network = *overrides.allow_network;
  if (overrides.allow_filesystem) policy.allow_filesystem = *overrides.allow_filesystem;
  if (overrides.require_signature) policy.require_signature = *overrides.require_signature;
  if (overrides.min_signatures) policy.min_signatures = *overrides.min_signatures;
  if (overrides.require_container) policy.require_container = *overrides.require_container;
  if (overrides.allowed_signers) policy.allowed_signers = *overrides.allowed_signers;
  if (overrides.blocked_modules) policy.blocked_modules = *overrides.blocked_modules;
  if (overrides.allowed_permissions) policy.allowed_permissions = *overrides.allowed_permissions;
  return policy;
}

SecurityPolicy CreatePolicy(std::string_view base, const PolicyOverrides& overrides) {
  return ApplyOverrides(GetPreset(base), overrides);
}

std::vector<PresetSummary> ListPresets() {
  std::vector<PresetSummary> out;
  for (const auto& preset : Presets()) {
    out.push_back({preset.name, preset.description, preset.isolation, preset.require_signature,
                   preset.min_signatures});
  }
  return out;
}

std::vector<std::string> ValidateForPolicy(const SecurityReport& report, const SecurityPolicy& policy,
                                           sandbox::IsolationLevel isolation) {
  std::vector<std::string> violations;
  if (policy.require_signature && !report.signature_valid) {
    violations.emplace_back(errors::msg::kPolicyRequiresSignature);
  }
  if (report.signature_count < policy.min_signatures) {
    violations.push_back("Insufficient signatures: " + std::to_string(report.signature_count) + " < " +
                         std::to_string(policy.min_signatures));
  }
  if (isolation != sandbox::IsolationLevel::kNone && !report.can_run_in_sandbox) {
    violations.emplace_back(errors::msg::kIsolationIncompatible);
  }
  if (report.code_analysis && !report.code_analysis->issues.empty()) {
    violations.push_back("Code analysis found " + std::to_string(report.code_analysis->issues.size()) +
                         " critical issues");
  }
  return violations;
}

}  // namespace warden::trust
