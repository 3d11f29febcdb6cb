#include "warden/trust/security_analyzer.h"

#include <chrono>

#include "warden/common.h"

namespace warden::trust {

namespace {

constexpr std::string_view kSandboxBreakingPatterns[] = {
    "__import__", "importlib", "sys.modules", "globals()", "locals()",
    "__class__.__bases__", "__subclasses__", "ctypes", "cffi",
};

}  // namespace

nlohmann::json SecurityReport::ToJson() const {
  return {
      {"plugin_id", plugin_id},
      {"analyzed_at", analyzed_at},
      {"trust_level", TrustLevelToString(trust_level)},
      {"is_safe", is_safe},
      {"can_run_in_sandbox", can_run_in_sandbox},
      {"code_analysis", code_analysis ? code_analysis->ToJson() : nlohmann::json()},
      {"signature_valid", signature_valid},
      {"signature_count", signature_count},
      {"required_permissions", required_permissions},
      {"code_hash", code_hash},
      {"recommendations", recommendations},
  };
}

TrustLevel DeriveTrustLevel(const std::optional<analysis::AnalysisResult>& analysis, bool signature_valid,
                            uint32_t signature_count, uint32_t min_signatures) {
  if (analysis && !analysis->issues.empty()) {
    return TrustLevel::kSandboxed;
  }
  if (signature_valid && signature_count >= min_signatures) {
    if (analysis && analysis->warnings.empty()) {
      return TrustLevel::kTrusted;
    }
    return TrustLevel::kVerified;
  }
  return TrustLevel::kUnverified;
}

bool CanRunInSandbox(std::string_view code, const std::optional<analysis::AnalysisResult>& analysis) {
  if (code.empty()) {
    return true;
  }
  if (analysis && !analysis->blocked_constructs.empty()) {
    return false;
  }
  for (auto pattern : kSandboxBreakingPatterns) {
    if (code.find(pattern) != std::string_view::npos) {
      return false;
    }
  }
  return true;
}

SecurityAnalyzer::SecurityAnalyzer(std::optional<SecurityPolicy> policy, analysis::AnalysisCache& cache,
                                   std::shared_ptr<crypto::CryptoProvider> crypto)
    : policy_(std::move(policy)), cache_(cache), crypto_(std::move(crypto)) {}

SecurityReport SecurityAnalyzer::AnalyzePlugin(std::string_view plugin_id, std::optional<std::string_view> code,
                                               bool signature_valid, uint32_t signature_count) {
  SecurityReport report;
  report.plugin_id = std::string(plugin_id);
  report.analyzed_at = FormatUtcTimestamp(std::chrono::system_clock::now());
  report.signature_valid = signature_valid;
  report.signature_count = signature_count;

  if (code && !code->empty()) {
    static const std::vector<std::string> kNoExtraModules;
    const auto& extra = policy_ ? policy_->blocked_modules : kNoExtraModules;
    auto analysis = cache_.Analyze(*code, extra);
    report.code_hash = crypto::Sha256Hex(*crypto_, *code);
    report.required_permissions = analysis.detected_permissions;
    if (analysis.complexity_score > kComplexityRecommendationThreshold) {
      report.recommendations.emplace_back("Consider breaking down complex code into smaller modules");
    }
    if (!analysis.warnings.empty()) {
      report.recommendations.push_back("Review " + std::to_string(analysis.warnings.size()) +
                                       " warnings before deployment");
    }
    if (!signature_valid) {
      report.recommendations.emplace_back("Sign the plugin for production use");
    }
    report.code_analysis = std::move(analysis);
  }

  const uint32_t min_signatures = policy_ ? policy_->min_signatures : 1;
  report.trust_level = DeriveTrustLevel(report.code_analysis, signature_valid, signature_count, min_signatures);
  report.can_run_in_sandbox = CanRunInSandbox(code.value_or(std::string_view()), report.code_analysis);

  const bool analysis_safe = !report.code_analysis || report.code_analysis->is_safe;
  const bool signature_ok = !policy_ || !policy_->require_signature || signature_valid;
  report.is_safe = analysis_safe && signature_ok;
  return report;
}

std::vector<std::string> SecurityAnalyzer::Validate(const SecurityReport& report) const {
  if (!policy_) {
    return {};
  }
  return ValidateForPolicy(report, *policy_, policy_->isolation);
}

}  // namespace warden::trust
