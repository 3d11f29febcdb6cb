#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/drivers/collaborators.h"
#include "warden/drivers/execution_log.h"
#include "warden/drivers/preflight.h"
#include "warden/sandbox/engine.h"

namespace warden::drivers {

struct ValidatorContext {
  std::string column_name;
  nlohmann::json values = nlohmann::json::array();
  nlohmann::json parameters = nlohmann::json::object();
  nlohmann::json schema = nlohmann::json::object();
  int64_t row_count{0};

  // Keyword arguments of the validator entry point.
  nlohmann::json ToEntryArgs() const;
};

struct ValidatorResult {
  bool passed{false};
  nlohmann::json issues = nlohmann::json::array();
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  double execution_time_ms{0.0};
  double memory_used_mb{0.0};
  std::vector<std::string> warnings;
  std::string execution_id;
  // kNone when the validator ran to completion, whatever its verdict.
  sandbox::FailureKind failure{sandbox::FailureKind::kNone};

  nlohmann::json ToJson() const;
};

struct ValidatorDefinition {
  std::string validator_id;
  std::string plugin_id;
  std::string code;
};

// Runs user validate() functions through a sandbox engine. Collaborators are
// optional; a null store, counter or sink is skipped.
class ValidatorDriver {
public:
  ValidatorDriver(sandbox::SandboxEngine& engine, analysis::AnalysisCache& cache,
                  std::shared_ptr<crypto::CryptoProvider> crypto, ExecutionLogStore* logs = nullptr,
                  UsageCounters* usage = nullptr, AuditSink* audit = nullptr);

  PreflightResult ValidateCode(std::string_view code) const;

  // Logs running, pre-flights, executes and finalizes the log exactly once.
  ValidatorResult Execute(const ValidatorDefinition& validator, const ValidatorContext& context,
                          std::string_view source_id = {});

  // Same path without a log or usage accounting. test_data carries
  // column_name, values and schema.
  nlohmann::json TestValidator(std::string_view code, const nlohmann::json& test_data,
                               const nlohmann::json& params);

private:
  ValidatorResult Run(std::string_view code, const ValidatorContext& context);

  sandbox::SandboxEngine& engine_;
  analysis::AnalysisCache& cache_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  ExecutionLogStore* logs_;
  UsageCounters* usage_;
  AuditSink* audit_;
};

}  // namespace warden::drivers
