#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/trust/policy.h"
#include "warden/trust/signing.h"

namespace warden::trust {

inline constexpr int kComplexityRecommendationThreshold = 50;

struct SecurityReport {
  std::string plugin_id;
  std::string analyzed_at;
  TrustLevel trust_level{TrustLevel::kUnverified};
  bool is_safe{false};
  bool can_run_in_sandbox{true};
  std::optional<analysis::AnalysisResult> code_analysis;
  bool signature_valid{false};
  uint32_t signature_count{0};
  std::vector<std::string> required_permissions;
  std::string code_hash;
  std::vector<std::string> recommendations;

  nlohmann::json ToJson() const;
};

// Issues force SANDBOXED; a valid signature meeting min_signatures yields
// TRUSTED for clean analysed code and VERIFIED for warnings-only or
// unanalysed code; everything else is UNVERIFIED.
TrustLevel DeriveTrustLevel(const std::optional<analysis::AnalysisResult>& analysis, bool signature_valid,
                            uint32_t signature_count, uint32_t min_signatures);

// False when the code relies on constructs that cannot work under the
// import gatekeeper.
bool CanRunInSandbox(std::string_view code, const std::optional<analysis::AnalysisResult>& analysis);

class SecurityAnalyzer {
public:
  SecurityAnalyzer(std::optional<SecurityPolicy> policy, analysis::AnalysisCache& cache,
                   std::shared_ptr<crypto::CryptoProvider> crypto);

  SecurityReport AnalyzePlugin(std::string_view plugin_id, std::optional<std::string_view> code,
                               bool signature_valid, uint32_t signature_count);

  // Violations against the analyzer's own policy; empty without one.
  std::vector<std::string> Validate(const SecurityReport& report) const;

  const std::optional<SecurityPolicy>& policy() const noexcept { return policy_; }

private:
  std::optional<SecurityPolicy> policy_;
  analysis::AnalysisCache& cache_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
};

}  // namespace warden::trust
