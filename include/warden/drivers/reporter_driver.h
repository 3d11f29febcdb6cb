#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/drivers/collaborators.h"
#include "warden/drivers/execution_log.h"
#include "warden/drivers/preflight.h"
#include "warden/sandbox/engine.h"

namespace warden::drivers {

struct TemplateRenderer {
  std::string template_text;
};

struct CodeRenderer {
  std::string code;
};

// monostate marks a reporter registered with neither a template nor code.
using Renderer = std::variant<std::monostate, TemplateRenderer, CodeRenderer>;

// A non-empty template wins over code.
Renderer MakeRenderer(std::string_view template_text, std::string_view code);

struct ReporterDefinition {
  std::string reporter_id;
  std::string plugin_id;
  Renderer renderer;
};

struct ReportContext {
  nlohmann::json data = nlohmann::json::object();
  nlohmann::json config = nlohmann::json::object();
  std::string format{"html"};
  nlohmann::json metadata = nlohmann::json::object();

  nlohmann::json ToEntryArgs() const;
};

struct ReportResult {
  bool success{false};
  std::string content;
  std::string content_type{"text/html"};
  std::string filename{"report.html"};
  std::string error;
  double execution_time_ms{0.0};
  double memory_used_mb{0.0};
  std::string execution_id;
  sandbox::FailureKind failure{sandbox::FailureKind::kNone};

  nlohmann::json ToJson() const;
};

class ReporterDriver {
public:
  ReporterDriver(sandbox::SandboxEngine& engine, analysis::AnalysisCache& cache,
                 std::shared_ptr<crypto::CryptoProvider> crypto, ExecutionLogStore* logs = nullptr,
                 UsageCounters* usage = nullptr, AuditSink* audit = nullptr);

  PreflightResult ValidateCode(std::string_view code) const;
  PreflightResult ValidateTemplate(std::string_view template_text) const;

  ReportResult Execute(const ReporterDefinition& reporter, const ReportContext& context,
                       std::string_view source_id = {});

  // No log and no usage accounting. Missing sample data and metadata get
  // preview defaults.
  ReportResult PreviewReport(std::optional<std::string_view> template_text, std::optional<std::string_view> code,
                             const nlohmann::json& sample_data = nullptr, const nlohmann::json& config = nullptr,
                             std::string_view format = "html");

private:
  struct RenderOutcome {
    ReportResult result;
    bool reached_sandbox{false};
    std::optional<PreflightResult> rejection;
  };

  RenderOutcome Render(const Renderer& renderer, const ReportContext& context);
  ReportResult RunSandboxed(sandbox::ExecutionRequest request);

  sandbox::SandboxEngine& engine_;
  analysis::AnalysisCache& cache_;
  std::shared_ptr<crypto::CryptoProvider> crypto_;
  ExecutionLogStore* logs_;
  UsageCounters* usage_;
  AuditSink* audit_;
};

}  // namespace warden::drivers
