#pragma once

#include <memory>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/drivers/collaborators.h"
#include "warden/drivers/execution_log.h"
#include "warden/drivers/reporter_driver.h"
#include "warden/drivers/validator_driver.h"
#include "warden/orchestrator/config.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/engine.h"
#include "warden/sandbox/factory.h"
#include "warden/trust/policy.h"
#include "warden/trust/security_analyzer.h"
#include "warden/trust/trust_store.h"
#include "warden/trust/verification.h"

namespace warden::orchestrator {

// Application root. Owns every shared component and hands out references;
// nothing in the library reaches for a global instance.
class Context {
public:
  explicit Context(WardenConfig config, std::shared_ptr<crypto::CryptoProvider> crypto = nullptr);
  ~Context();

  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  const WardenConfig& config() const noexcept { return config_; }
  crypto::CryptoProvider& crypto() noexcept { return *crypto_; }
  const std::shared_ptr<crypto::CryptoProvider>& crypto_ptr() const noexcept { return crypto_; }
  EventBus& bus() noexcept { return *bus_; }
  const std::shared_ptr<JsonLineLogger>& logger() const noexcept { return logger_; }

  trust::TrustStore& trust_store() noexcept { return *trust_store_; }
  analysis::AnalysisCache& analysis_cache() noexcept { return *analysis_cache_; }
  const trust::SecurityPolicy& policy() const noexcept { return policy_; }
  const sandbox::SandboxConfig& sandbox_config() const noexcept { return sandbox_config_; }

  sandbox::SandboxEngine& engine() noexcept { return *engine_; }
  // Builds an extra engine sharing this context's collaborators.
  std::unique_ptr<sandbox::SandboxEngine> CreateEngine(const sandbox::SandboxConfig& config);

  drivers::InMemoryExecutionLogStore& execution_logs() noexcept { return *execution_logs_; }
  drivers::InMemoryUsageCounters& usage() noexcept { return *usage_; }
  drivers::AuditSink& audit() noexcept { return *audit_; }
  drivers::ValidatorDriver& validators() noexcept { return *validators_; }
  drivers::ReporterDriver& reporters() noexcept { return *reporters_; }

  // Chain sized by the active policy. The code safety stage only applies when
  // the signed payload is Python source.
  trust::VerificationChain CreateVerificationChain(bool check_code_safety = true);
  trust::SecurityAnalyzer CreateSecurityAnalyzer();

private:
  WardenConfig config_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  std::shared_ptr<JsonLineLogger> logger_;
  std::unique_ptr<EventBus> bus_;
  std::unique_ptr<trust::TrustStore> trust_store_;
  std::unique_ptr<analysis::AnalysisCache> analysis_cache_;
  trust::SecurityPolicy policy_;
  sandbox::SandboxConfig sandbox_config_;
  std::shared_ptr<sandbox::EmbeddedPython> embedded_;
  std::unique_ptr<sandbox::SandboxEngine> engine_;
  std::unique_ptr<drivers::InMemoryExecutionLogStore> execution_logs_;
  std::unique_ptr<drivers::InMemoryUsageCounters> usage_;
  std::unique_ptr<drivers::EventBusAuditSink> audit_;
  std::unique_ptr<drivers::ValidatorDriver> validators_;
  std::unique_ptr<drivers::ReporterDriver> reporters_;
};

}  // namespace warden::orchestrator
