#include "warden/drivers/validator_driver.h"

#include "warden/drivers/templates.h"
#include "warden/errors.h"

namespace warden::drivers {

namespace {

std::string FailureMessage(const sandbox::SandboxResult& result) {
  return result.error.empty() ? std::string(errors::msg::kExecutionFailed) : result.error;
}

}  // namespace

nlohmann::json ValidatorContext::ToEntryArgs() const {
  return {
      {"column_name", column_name}, {"values", values},       {"params", parameters},
      {"schema", schema},           {"row_count", row_count},
  };
}

nlohmann::json ValidatorResult::ToJson() const {
  nlohmann::json out = {
      {"passed", passed},
      {"issues", issues},
      {"message", message},
      {"details", details},
      {"execution_time_ms", execution_time_ms},
      {"memory_used_mb", memory_used_mb},
      {"warnings", warnings},
  };
  if (!execution_id.empty()) {
    out["execution_id"] = execution_id;
  }
  if (failure != sandbox::FailureKind::kNone) {
    out["failure"] = sandbox::FailureKindToString(failure);
  }
  return out;
}

ValidatorDriver::ValidatorDriver(sandbox::SandboxEngine& engine, analysis::AnalysisCache& cache,
                                 std::shared_ptr<crypto::CryptoProvider> crypto, ExecutionLogStore* logs,
                                 UsageCounters* usage, AuditSink* audit)
    : engine_(engine), cache_(cache), crypto_(std::move(crypto)), logs_(logs), usage_(usage), audit_(audit) {}

PreflightResult ValidatorDriver::ValidateCode(std::string_view code) const {
  return PreflightValidatorCode(code, cache_, engine_.config().blocked_modules);
}

ValidatorResult ValidatorDriver::Run(std::string_view code, const ValidatorContext& context) {
  sandbox::ExecutionRequest request;
  request.code = WrapValidatorCode(code);
  request.entry_point = kValidatorEntryPoint;
  request.entry_args = context.ToEntryArgs();
  auto sandboxed = engine_.Execute(request);

  ValidatorResult out;
  out.execution_time_ms = sandboxed.execution_time_ms;
  out.memory_used_mb = sandboxed.memory_used_mb;
  out.warnings = sandboxed.warnings;
  if (sandboxed.success && sandboxed.result.is_object()) {
    const auto& body = sandboxed.result;
    out.passed = body.value("passed", false);
    out.issues = body.value("issues", nlohmann::json::array());
    out.message = body.value("message", std::string());
    out.details = body.value("details", nlohmann::json::object());
    return out;
  }

  out.passed = false;
  out.message = FailureMessage(sandboxed);
  out.failure = sandboxed.failure == sandbox::FailureKind::kNone ? sandbox::FailureKind::kProtocolFailure
                                                                 : sandboxed.failure;
  out.details = {
      {"stdout", sandboxed.stdout_text},
      {"stderr", sandboxed.stderr_text},
      {"error_type", sandboxed.error_type},
  };
  return out;
}

ValidatorResult ValidatorDriver::Execute(const ValidatorDefinition& validator, const ValidatorContext& context,
                                         std::string_view source_id) {
  ExecutionLog log;
  log.execution_id = NewExecutionId(*crypto_);
  log.plugin_id = validator.plugin_id;
  log.validator_id = validator.validator_id;
  log.source_id = std::string(source_id);
  if (logs_) {
    logs_->Create(log);
  }

  auto preflight = ValidateCode(validator.code);
  if (!preflight.passed()) {
    ValidatorResult rejected;
    rejected.execution_id = log.execution_id;
    rejected.message = preflight.RejectionMessage();
    rejected.failure = sandbox::FailureKind::kSecurityViolation;
    rejected.warnings = preflight.issues;
    rejected.details = {{"issues", preflight.issues}};
    if (audit_) {
      audit_->Record(PreflightRejectedEvent(preflight, validator.validator_id));
    }
    if (logs_) {
      logs_->Fail(log.execution_id, rejected.message);
    }
    return rejected;
  }

  auto result = Run(validator.code, context);
  result.execution_id = log.execution_id;
  result.warnings.insert(result.warnings.begin(), preflight.warnings.begin(), preflight.warnings.end());

  if (usage_) {
    usage_->Increment(UsageKind::kValidator, validator.validator_id);
    if (!validator.plugin_id.empty()) {
      usage_->Increment(UsageKind::kPlugin, validator.plugin_id);
    }
  }

  if (logs_) {
    if (result.failure == sandbox::FailureKind::kNone && result.passed) {
      logs_->Complete(log.execution_id, {{"passed", result.passed}, {"issues_count", result.issues.size()}},
                      result.memory_used_mb);
    } else {
      logs_->Fail(log.execution_id, result.message);
    }
  }
  return result;
}

nlohmann::json ValidatorDriver::TestValidator(std::string_view code, const nlohmann::json& test_data,
                                              const nlohmann::json& params) {
  auto preflight = ValidateCode(code);
  if (!preflight.passed()) {
    return {
        {"success", false},
        {"passed", nullptr},
        {"error", preflight.RejectionMessage()},
        {"execution_time_ms", 0},
        {"warnings", preflight.issues},
    };
  }

  const nlohmann::json data = test_data.is_object() ? test_data : nlohmann::json::object();
  ValidatorContext context;
  context.column_name = data.value("column_name", std::string("test_column"));
  context.values = data.value("values", nlohmann::json::array());
  context.schema = data.value("schema", nlohmann::json::object());
  context.parameters = params.is_object() ? params : nlohmann::json::object();
  context.row_count = context.values.is_array() ? static_cast<int64_t>(context.values.size()) : 0;

  auto result = Run(code, context);
  if (result.failure == sandbox::FailureKind::kNone) {
    return {
        {"success", true},
        {"passed", result.passed},
        {"result",
         {{"passed", result.passed}, {"issues", result.issues}, {"message", result.message}, {"details", result.details}}},
        {"execution_time_ms", result.execution_time_ms},
        {"warnings", result.warnings},
    };
  }
  return {
      {"success", false},
      {"passed", nullptr},
      {"error", result.message},
      {"failure", sandbox::FailureKindToString(result.failure)},
      {"execution_time_ms", result.execution_time_ms},
      {"warnings", result.warnings},
  };
}

}  // namespace warden::drivers
