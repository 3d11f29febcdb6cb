#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/sandbox/config.h"

namespace warden::trust {

struct SecurityReport;

struct SecurityPolicy {
  std::string name;
  std::string description;
  sandbox::IsolationLevel isolation{sandbox::IsolationLevel::kProcess};
  uint32_t memory_limit_mb{256};
  uint32_t cpu_time_limit_sec{30};
  uint32_t wall_time_limit_sec{60};
  uint32_t max_file_size_mb{10};
  uint32_t max_open_files{10};
  uint32_t max_processes{1};
  bool allow_network{false};
  bool allow_filesystem{false};
  bool require_signature{false};
  uint32_t min_signatures{0};
  // Empty means any trusted signer.
  std::vector<std::string> allowed_signers;
  std::vector<std::string> blocked_modules;
  std::vector<std::string> allowed_permissions;
  bool require_container{false};

  // Copies limits, switches and isolation onto base and merges the block
  // list into base's. Runtime settings of base are kept.
  sandbox::SandboxConfig ToSandboxConfig(const sandbox::SandboxConfig& base = {}) const;
  nlohmann::json ToJson() const;
};

struct PolicyOverrides {
  std::optional<sandbox::IsolationLevel> isolation;
  std::optional<uint32_t> memory_limit_mb;
  std::optional<uint32_t> cpu_time_limit_sec;
  std::optional<uint32_t> wall_time_limit_sec;
  std::optional<uint32_t> max_file_size_mb;
  std::optional<uint32_t> max_open_files;
  std::optional<uint32_t> max_processes;
  std::optional<bool> allow_network;
  std::optional<bool> allow_filesystem;
  std::optional<bool> require_signature;
  std::optional<uint32_t> min_signatures;
  std::optional<bool> require_container;
  std::optional<std::vector<std::string>> allowed_signers;
  std::optional<std::vector<std::string>> blocked_modules;
  std::optional<std::vector<std::string>> allowed_permissions;

  // Parses one textual override such as "memory_limit_mb=128". Throws
  // Error(Config) on an unknown field or a malformed value.
  void Set(std::string_view field, std::string_view value);
};

struct PresetSummary {
  std::string name;
  std::string description;
  sandbox::IsolationLevel isolation{sandbox::IsolationLevel::kProcess};
  bool require_signature{false};
  uint32_t min_signatures{0};
};

// Presets in tightening order: development, testing, standard, enterprise,
// strict, airgapped.
const std::vector<std::string>& PresetNames();
// Returns a copy. Throws Error(Config) "Unknown security preset: x".
SecurityPolicy GetPreset(std::string_view name);
SecurityPolicy CreatePolicy(std::string_view base, const PolicyOverrides& overrides);
SecurityPolicy ApplyOverrides(SecurityPolicy policy, const PolicyOverrides& overrides);
std::vector<PresetSummary> ListPresets();

// Empty when the report satisfies the policy at the given isolation level.
std::vector<std::string> ValidateForPolicy(const SecurityReport& report, const SecurityPolicy& policy,
                                           sandbox::IsolationLevel isolation);

}  // namespace warden::trust
