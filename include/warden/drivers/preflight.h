#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/analysis/analyzer.h"
#include "warden/orchestrator/event_bus.h"

namespace warden::drivers {

enum class PreflightSubject : uint8_t { kValidatorCode, kReporterCode, kTemplate };

struct PreflightResult {
  PreflightSubject subject{PreflightSubject::kValidatorCode};
  // Every offending construct, in detection order.
  std::vector<std::string> issues;
  std::vector<std::string> warnings;

  bool passed() const noexcept { return issues.empty(); }
  // "Code validation failed: a; b" or "Template validation failed: a; b".
  std::string RejectionMessage() const;
  nlohmann::json ToJson() const;
};

// Textual checks (entry function present, dangerous substrings) followed by
// the analyzer's blocking issues. Runs before any sandbox is touched.
PreflightResult PreflightValidatorCode(std::string_view code, analysis::AnalysisCache& cache,
                                       const std::vector<std::string>& blocked_modules);
PreflightResult PreflightReporterCode(std::string_view code, analysis::AnalysisCache& cache,
                                      const std::vector<std::string>& blocked_modules);
PreflightResult PreflightTemplate(std::string_view template_text);

// Security event recorded when a pre-flight check turns code away.
orchestrator::Event PreflightRejectedEvent(const PreflightResult& result, std::string_view subject_id);

}  // namespace warden::drivers
