#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "warden/sandbox/config.h"
#include "warden/sandbox/engine.h"
#include "warden/sandbox/result.h"

namespace warden::sandbox {

inline constexpr std::string_view kResultMarker = "__WARDEN_RESULT_";

// Python source executed by the process and container engines. It reads the
// request (file argument or stdin), runs the code under a restricted builtins
// mapping with a guarded __import__ and writes one delimited result block to
// --result-fd, or to stdout when no descriptor is given.
std::string_view RunnerScript();

nlohmann::json BuildRunnerRequest(const SandboxConfig& config, const ExecutionRequest& request,
                                  std::string_view nonce);

std::string BeginDelimiter(std::string_view nonce);
std::string EndDelimiter(std::string_view nonce);

enum class BlockStatus { kMissing, kMalformed, kFound };

struct ExtractedBlock {
  BlockStatus status{BlockStatus::kMissing};
  nlohmann::json payload;
  // Input text with the block removed.
  std::string remainder;
  std::string error;
};

ExtractedBlock ExtractResultBlock(std::string_view text, std::string_view nonce);

// Maps a runner payload onto the result taxonomy. Shared by every engine so
// identical code classifies identically.
void ApplyRunnerPayload(const nlohmann::json& payload, SandboxResult& out);

// Caps captured output and appends the truncation suffix when needed.
void TruncateOutput(std::string& text, size_t limit, bool already_truncated);

// Guarantees non-empty error and error_type on failure.
void EnsureFailureDetails(SandboxResult& result);

}  // namespace warden::sandbox
