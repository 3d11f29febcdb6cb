#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden::sandbox {

enum class IsolationLevel : uint8_t { kNone = 0, kProcess = 1, kContainer = 2 };

const char* IsolationToString(IsolationLevel level);
std::optional<IsolationLevel> ParseIsolation(std::string_view text);

inline constexpr size_t kDefaultMaxOutputBytes = 1024 * 1024;
inline constexpr const char* kDefaultContainerImage = "python:3.11-slim";

std::vector<std::string> DefaultAllowedModules();
std::vector<std::string> DefaultBlockedModules();
std::vector<std::string> DefaultAllowedBuiltins();

struct SandboxConfig {
  IsolationLevel isolation{IsolationLevel::kProcess};
  uint32_t memory_limit_mb{256};
  uint32_t cpu_time_limit_sec{30};
  uint32_t wall_time_limit_sec{60};
  uint32_t max_file_size_mb{10};
  uint32_t max_open_files{10};
  uint32_t max_processes{1};
  bool allow_network{false};
  bool allow_filesystem{false};
  std::vector<std::string> allowed_modules{DefaultAllowedModules()};
  std::vector<std::string> blocked_modules{DefaultBlockedModules()};
  std::vector<std::string> allowed_builtins{DefaultAllowedBuiltins()};
  std::string container_image{kDefaultContainerImage};
  // "auto", "docker", "podman" or "none".
  std::string container_runtime{"auto"};
  // Empty means resolve through sys.executable of the python3 on PATH.
  std::string python_executable;
  size_t max_output_bytes{kDefaultMaxOutputBytes};
  bool require_container{false};

  // Allow-list handed to the import gatekeeper; io joins it only with filesystem access.
  std::vector<std::string> EffectiveAllowedModules() const;
};

}  // namespace warden::sandbox
