#include "warden/sandbox/result.h"

namespace warden::sandbox {

const char* FailureKindToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::kNone:
    return "none";
  case FailureKind::kParseFailure:
    return "parse_failure";
  case FailureKind::kSecurityViolation:
    return "security_violation";
  case FailureKind::kResourceExceeded:
    return "resource_exceeded";
  case FailureKind::kExecutionFailure:
    return "execution_failure";
  case FailureKind::kProtocolFailure:
    return "protocol_failure";
  case FailureKind::kRuntimeUnavailable:
    return "runtime_unavailable";
  case FailureKind::kVerificationFailure:
    return "verification_failure";
  }
  return "none";
}

nlohmann::json SandboxResult::ToJson() const {
  nlohmann::json out = {
      {"success", success},
      {"result", result},
      {"stdout", stdout_text},
      {"stderr", stderr_text},
      {"execution_time_ms", execution_time_ms},
      {"exit_code", exit_code},
      {"memory_used_mb", memory_used_mb},
      {"warnings", warnings},
  };
  if (!success) {
    out["error"] = error;
    out["error_type"] = error_type;
    out["failure"] = FailureKindToString(failure);
  }
  return out;
}

}  // namespace warden::sandbox
