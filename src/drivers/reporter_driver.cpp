#include "warden/drivers/reporter_driver.h"

#include <chrono>
#include <type_traits>

#include "warden/common.h"
#include "warden/drivers/templates.h"
#include "warden/errors.h"

namespace warden::drivers {

Renderer MakeRenderer(std::string_view template_text, std::string_view code) {
  if (!template_text.empty()) {
    return TemplateRenderer{std::string(template_text)};
  }
  if (!code.empty()) {
    return CodeRenderer{std::string(code)};
  }
  return std::monostate{};
}

nlohmann::json ReportContext::ToEntryArgs() const {
  return {{"data", data}, {"config", config}, {"format", format}, {"metadata", metadata}};
}

nlohmann::json ReportResult::ToJson() const {
  nlohmann::json out = {
      {"success", success},
      {"content", content},
      {"content_type", content_type},
      {"filename", filename},
      {"error", error.empty() ? nlohmann::json() : nlohmann::json(error)},
      {"execution_time_ms", execution_time_ms},
  };
  if (!execution_id.empty()) {
    out["execution_id"] = execution_id;
  }
  if (failure != sandbox::FailureKind::kNone) {
    out["failure"] = sandbox::FailureKindToString(failure);
  }
  return out;
}

ReporterDriver::ReporterDriver(sandbox::SandboxEngine& engine, analysis::AnalysisCache& cache,
                               std::shared_ptr<crypto::CryptoProvider> crypto, ExecutionLogStore* logs,
                               UsageCounters* usage, AuditSink* audit)
    : engine_(engine), cache_(cache), crypto_(std::move(crypto)), logs_(logs), usage_(usage), audit_(audit) {}

PreflightResult ReporterDriver::ValidateCode(std::string_view code) const {
  return PreflightReporterCode(code, cache_, engine_.config().blocked_modules);
}

PreflightResult ReporterDriver::ValidateTemplate(std::string_view template_text) const {
  return PreflightTemplate(template_text);
}

ReportResult ReporterDriver::RunSandboxed(sandbox::ExecutionRequest request) {
  auto sandboxed = engine_.Execute(request);
  ReportResult out;
  out.execution_time_ms = sandboxed.execution_time_ms;
  out.memory_used_mb = sandboxed.memory_used_mb;
  if (sandboxed.success && sandboxed.result.is_object()) {
    const auto& body = sandboxed.result;
    out.success = true;
    out.content = body.value("content", std::string());
    out.content_type = body.value("content_type", std::string("text/html"));
    out.filename = body.value("filename", std::string("report.html"));
    return out;
  }
  out.error = sandboxed.error.empty() ? std::string(errors::msg::kExecutionFailed) : sandboxed.error;
  out.failure = sandboxed.failure == sandbox::FailureKind::kNone ? sandbox::FailureKind::kProtocolFailure
                                                                 : sandboxed.failure;
  return out;
}

ReporterDriver::RenderOutcome ReporterDriver::Render(const Renderer& renderer, const ReportContext& context) {
  return std::visit(
      [&](const auto& variant) -> RenderOutcome {
        using T = std::decay_t<decltype(variant)>;
        RenderOutcome outcome;
        if constexpr (std::is_same_v<T, std::monostate>) {
          outcome.result.error = std::string(errors::msg::kReporterEmpty);
          outcome.result.failure = sandbox::FailureKind::kExecutionFailure;
        } else if constexpr (std::is_same_v<T, TemplateRenderer>) {
          auto preflight = ValidateTemplate(variant.template_text);
          if (!preflight.passed()) {
            outcome.result.error = preflight.RejectionMessage();
            outcome.result.failure = sandbox::FailureKind::kSecurityViolation;
            outcome.rejection = std::move(preflight);
            return outcome;
          }
          sandbox::ExecutionRequest request;
          request.code = std::string(TemplateRendererCode());
          request.globals = {{kTemplateGlobal, variant.template_text}};
          request.entry_point = kTemplateEntryPoint;
          request.entry_args = context.ToEntryArgs();
          outcome.result = RunSandboxed(std::move(request));
          outcome.reached_sandbox = true;
        } else {
          auto preflight = ValidateCode(variant.code);
          if (!preflight.passed()) {
            outcome.result.error = preflight.RejectionMessage();
            outcome.result.failure = sandbox::FailureKind::kSecurityViolation;
            outcome.rejection = std::move(preflight);
            return outcome;
          }
          sandbox::ExecutionRequest request;
          request.code = WrapReporterCode(variant.code);
          request.entry_point = kReporterEntryPoint;
          request.entry_args = context.ToEntryArgs();
          outcome.result = RunSandboxed(std::move(request));
          outcome.reached_sandbox = true;
        }
        return outcome;
      },
      renderer);
}

ReportResult ReporterDriver::Execute(const ReporterDefinition& reporter, const ReportContext& context,
                                     std::string_view source_id) {
  ExecutionLog log;
  log.execution_id = NewExecutionId(*crypto_);
  log.plugin_id = reporter.plugin_id;
  log.reporter_id = reporter.reporter_id;
  log.source_id = std::string(source_id);
  if (logs_) {
    logs_->Create(log);
  }

  auto outcome = Render(reporter.renderer, context);
  auto& result = outcome.result;
  result.execution_id = log.execution_id;

  if (outcome.rejection && audit_) {
    audit_->Record(PreflightRejectedEvent(*outcome.rejection, reporter.reporter_id));
  }
  if (outcome.reached_sandbox && usage_) {
    usage_->Increment(UsageKind::kReporter, reporter.reporter_id);
    if (!reporter.plugin_id.empty()) {
      usage_->Increment(UsageKind::kPlugin, reporter.plugin_id);
    }
  }
  if (logs_) {
    if (result.success) {
      logs_->Complete(log.execution_id,
                      {{"filename", result.filename},
                       {"content_type", result.content_type},
                       {"size", result.content.size()}},
                      result.memory_used_mb);
    } else {
      logs_->Fail(log.execution_id, result.error);
    }
  }
  return result;
}

ReportResult ReporterDriver::PreviewReport(std::optional<std::string_view> template_text,
                                           std::optional<std::string_view> code, const nlohmann::json& sample_data,
                                           const nlohmann::json& config, std::string_view format) {
  auto renderer = MakeRenderer(template_text.value_or(std::string_view()), code.value_or(std::string_view()));
  if (std::holds_alternative<std::monostate>(renderer)) {
    ReportResult out;
    out.error = std::string(errors::msg::kNoTemplateOrCode);
    out.failure = sandbox::FailureKind::kExecutionFailure;
    return out;
  }

  ReportContext context;
  context.data = sample_data.is_object() && !sample_data.empty() ? sample_data
                                                                 : nlohmann::json{{"message", "Sample report data"}};
  context.config = config.is_object() ? config : nlohmann::json::object();
  context.format = std::string(format);
  context.metadata = {
      {"generated_at", FormatUtcTimestamp(std::chrono::system_clock::now())},
      {"is_preview", true},
  };
  return Render(renderer, context).result;
}

}  // namespace warden::drivers
