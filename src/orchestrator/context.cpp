#include "warden/orchestrator/context.h"

namespace warden::orchestrator {

Context::Context(WardenConfig config, std::shared_ptr<crypto::CryptoProvider> crypto)
    : config_(std::move(config)), crypto_(crypto ? std::move(crypto) : crypto::MakeOpenSSLCryptoProvider()) {
  if (!config_.audit_log.empty()) {
    AuditLogOptions options;
    options.path = config_.audit_log;
    options.key = config_.audit_key;
    options.max_bytes = config_.audit_log_max_bytes;
    logger_ = std::make_shared<JsonLineLogger>(std::move(options), crypto_);
    bus_ = std::make_unique<EventBus>(logger_);
  } else {
    bus_ = std::make_unique<EventBus>();
  }

  trust_store_ = std::make_unique<trust::TrustStore>(bus_.get());
  if (!config_.trust_store.empty()) {
    trust::LoadTrustFile(config_.trust_store, *trust_store_);
  }
  analysis_cache_ = std::make_unique<analysis::AnalysisCache>(config_.analysis_cache_entries, crypto_);

  policy_ = config_.ResolvePolicy();
  sandbox_config_ = config_.ResolveSandboxConfig(policy_);
  engine_ = CreateEngine(sandbox_config_);

  execution_logs_ = std::make_unique<drivers::InMemoryExecutionLogStore>(bus_.get());
  usage_ = std::make_unique<drivers::InMemoryUsageCounters>();
  audit_ = std::make_unique<drivers::EventBusAuditSink>(*bus_);
  validators_ = std::make_unique<drivers::ValidatorDriver>(*engine_, *analysis_cache_, crypto_, execution_logs_.get(),
                                                           usage_.get(), audit_.get());
  reporters_ = std::make_unique<drivers::ReporterDriver>(*engine_, *analysis_cache_, crypto_, execution_logs_.get(),
                                                         usage_.get(), audit_.get());

  Event ready;
  ready.category = EventCategory::kLifecycle;
  ready.event_id = "context_ready";
  ready.message = "Warden context initialized";
  ready.fields.emplace_back("policy", policy_.name);
  ready.fields.emplace_back("engine", std::string(engine_->name()));
  ready.fields.emplace_back("trusted_signers", std::to_string(trust_store_->size()), FieldPrivacy::kPublic, true);
  PublishSafely(*bus_, ready);
}

// Drivers hold references into the engine, the engine into the embedded
// runtime; members are destroyed in reverse order of declaration.
Context::~Context() = default;

std::unique_ptr<sandbox::SandboxEngine> Context::CreateEngine(const sandbox::SandboxConfig& config) {
  if (config.isolation == sandbox::IsolationLevel::kNone && !embedded_) {
    embedded_ = std::make_shared<sandbox::EmbeddedPython>();
  }
  sandbox::EngineDependencies deps;
  deps.crypto = crypto_;
  deps.bus = bus_.get();
  deps.embedded = embedded_;
  return sandbox::CreateEngine(config, deps);
}

trust::VerificationChain Context::CreateVerificationChain(bool check_code_safety) {
  const uint32_t min_signatures = policy_.min_signatures == 0 ? 1 : policy_.min_signatures;
  return trust::CreateVerificationChain(*trust_store_, crypto_, min_signatures,
                                        check_code_safety ? analysis_cache_.get() : nullptr, bus_.get());
}

trust::SecurityAnalyzer Context::CreateSecurityAnalyzer() {
  return trust::SecurityAnalyzer(policy_, *analysis_cache_, crypto_);
}

}  // namespace warden::orchestrator
