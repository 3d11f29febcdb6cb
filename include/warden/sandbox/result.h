#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace warden::sandbox {

enum class FailureKind : uint8_t {
  kNone = 0,
  kParseFailure,
  kSecurityViolation,
  kResourceExceeded,
  kExecutionFailure,
  kProtocolFailure,
  kRuntimeUnavailable,
  kVerificationFailure
};

const char* FailureKindToString(FailureKind kind);

struct SandboxResult {
  bool success{false};
  nlohmann::json result;
  std::string stdout_text;
  std::string stderr_text;
  std::string error;
  std::string error_type;
  FailureKind failure{FailureKind::kNone};
  double execution_time_ms{0.0};
  int exit_code{0};
  double memory_used_mb{0.0};
  std::vector<std::string> warnings;

  static SandboxResult Failure(FailureKind kind, std::string error_type, std::string message) {
    SandboxResult out;
    out.success = false;
    out.failure = kind;
    out.error_type = std::move(error_type);
    out.error = std::move(message);
    return out;
  }

  nlohmann::json ToJson() const;
};

}  // namespace warden::sandbox
