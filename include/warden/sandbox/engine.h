#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "warden/sandbox/config.h"
#include "warden/sandbox/result.h"

namespace warden::sandbox {

struct ExecutionRequest {
  std::string code;
  nlohmann::json globals = nlohmann::json::object();
  nlohmann::json locals = nlohmann::json::object();
  std::optional<std::string> entry_point;
  // Object -> keyword arguments, array -> positional arguments.
  nlohmann::json entry_args = nlohmann::json::object();
};

// Common contract for every isolation backend. Execute never throws: every
// failure, including internal ones, is classified into the returned result.
class SandboxEngine {
public:
  virtual ~SandboxEngine() = default;

  virtual SandboxResult Execute(const ExecutionRequest& request) noexcept = 0;

  virtual IsolationLevel isolation() const noexcept = 0;
  virtual std::string_view name() const noexcept = 0;
  virtual const SandboxConfig& config() const noexcept = 0;
};

}  // namespace warden::sandbox
