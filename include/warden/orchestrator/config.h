#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "warden/analysis/analyzer.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/config.h"
#include "warden/trust/policy.h"

namespace warden::orchestrator {

inline constexpr const char* kConfigEnv = "WARDEN_CONFIG";
inline constexpr const char* kPythonEnv = "WARDEN_PYTHON";
inline constexpr const char* kAuditLogMaxSizeEnv = "WARDEN_AUDIT_LOG_MAX_SIZE";

struct WardenConfig {
  std::string policy{"standard"};
  std::string python;
  std::string container_runtime{"auto"};
  std::string container_image{sandbox::kDefaultContainerImage};
  bool container_fail_closed{true};
  std::filesystem::path audit_log;
  size_t audit_log_max_bytes{kDefaultAuditLogMaxBytes};
  std::vector<uint8_t> audit_key;
  std::filesystem::path trust_store;
  size_t analysis_cache_entries{analysis::kDefaultAnalysisCacheEntries};
  size_t max_output_bytes{sandbox::kDefaultMaxOutputBytes};
  std::vector<std::string> blocked_modules;
  trust::PolicyOverrides overrides;

  // Preset plus overrides. container_fail_closed=false clears require_container.
  trust::SecurityPolicy ResolvePolicy() const;
  sandbox::SandboxConfig ResolveSandboxConfig(const trust::SecurityPolicy& policy) const;
};

// Parses warden.conf. Throws Error(Config) naming the offending line.
WardenConfig ParseConfig(std::string_view text);
WardenConfig LoadConfig(const std::filesystem::path& path);

// Uses explicit_path, then $WARDEN_CONFIG, then built-in defaults, and applies
// the WARDEN_PYTHON and WARDEN_AUDIT_LOG_MAX_SIZE overrides.
WardenConfig LoadConfigFromEnvironment(const std::optional<std::filesystem::path>& explicit_path);

}  // namespace warden::orchestrator
