#pragma once

#include <string_view>

namespace warden::errors::msg {
// Centralized message catalog. Driver and verifier output is user visible, keep wording stable.
inline constexpr std::string_view kNoMatchingSigner{"No matching trusted signer"};
inline constexpr std::string_view kNoSignatures{"No signatures provided"};
inline constexpr std::string_view kHmacRequiresKey{"HMAC verification requires a key"};
inline constexpr std::string_view kSignatureMismatch{"Signature mismatch"};
inline constexpr std::string_view kPolicyRequiresSignature{"Plugin requires valid signature"};
inline constexpr std::string_view kIsolationIncompatible{"Plugin not compatible with required isolation level"};
inline constexpr std::string_view kRuntimeUnavailable{"No container runtime available and policy requires container isolation"};
inline constexpr std::string_view kRuntimeFallback{"Container runtime unavailable; executed with process isolation"};
inline constexpr std::string_view kNoResultProduced{"Sandbox produced no result"};
inline constexpr std::string_view kResultTooLarge{"Result payload exceeds limit"};
inline constexpr std::string_view kCpuLimitExceeded{"CPU time limit exceeded"};
inline constexpr std::string_view kExecutionFailed{"Execution failed"};
inline constexpr std::string_view kMissingValidate{"Missing required 'validate' function"};
inline constexpr std::string_view kMissingGenerateReport{"Missing required 'generate_report' function"};
inline constexpr std::string_view kNoTemplateOrCode{"No template or code provided"};
inline constexpr std::string_view kReporterEmpty{"Reporter has no template or code"};
inline constexpr std::string_view kCodeValidationFailed{"Code validation failed: "};
inline constexpr std::string_view kTemplateValidationFailed{"Template validation failed: "};
inline constexpr std::string_view kTruncatedSuffix{"\n... (truncated)"};
}  // namespace warden::errors::msg
