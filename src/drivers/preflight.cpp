#include "warden/drivers/preflight.h"

#include "warden/common.h"
#include "warden/errors.h"

namespace warden::drivers {

namespace {

constexpr std::string_view kValidatorPatterns[] = {
    "os.system", "subprocess", "exec(", "eval(", "__import__", "open(", "file(",
};

constexpr std::string_view kReporterPatterns[] = {
    "os.system", "subprocess", "__import__", "open(", "file(",
};

constexpr std::string_view kTemplatePatterns[] = {
    "{% import", "{% include", "{{ self", "{{ config.__", "{{ request", "{{ session",
};

template <size_t N>
void CheckPatterns(std::string_view code, const std::string_view (&patterns)[N], PreflightResult& out) {
  for (auto pattern : patterns) {
    if (code.find(pattern) != std::string_view::npos) {
      out.issues.push_back("Dangerous pattern detected: " + std::string(pattern));
    }
  }
}

void MergeAnalysis(std::string_view code, analysis::AnalysisCache& cache,
                   const std::vector<std::string>& blocked_modules, PreflightResult& out) {
  auto analysis = cache.Analyze(code, blocked_modules);
  out.issues.insert(out.issues.end(), analysis.issues.begin(), analysis.issues.end());
  out.warnings.insert(out.warnings.end(), analysis.warnings.begin(), analysis.warnings.end());
}

}  // namespace

std::string PreflightResult::RejectionMessage() const {
  const auto prefix = subject == PreflightSubject::kTemplate ? errors::msg::kTemplateValidationFailed
                                                             : errors::msg::kCodeValidationFailed;
  return std::string(prefix) + Join(issues, "; ");
}

nlohmann::json PreflightResult::ToJson() const {
  return {{"is_valid", passed()}, {"issues", issues}, {"warnings", warnings}};
}

PreflightResult PreflightValidatorCode(std::string_view code, analysis::AnalysisCache& cache,
                                       const std::vector<std::string>& blocked_modules) {
  PreflightResult out;
  out.subject = PreflightSubject::kValidatorCode;
  if (code.find("def validate(") == std::string_view::npos) {
    out.issues.emplace_back(errors::msg::kMissingValidate);
  }
  CheckPatterns(code, kValidatorPatterns, out);
  MergeAnalysis(code, cache, blocked_modules, out);
  return out;
}

PreflightResult PreflightReporterCode(std::string_view code, analysis::AnalysisCache& cache,
                                      const std::vector<std::string>& blocked_modules) {
  PreflightResult out;
  out.subject = PreflightSubject::kReporterCode;
  if (code.find("def generate_report(") == std::string_view::npos) {
    out.issues.emplace_back(errors::msg::kMissingGenerateReport);
  }
  CheckPatterns(code, kReporterPatterns, out);
  MergeAnalysis(code, cache, blocked_modules, out);
  return out;
}

PreflightResult PreflightTemplate(std::string_view template_text) {
  PreflightResult out;
  out.subject = PreflightSubject::kTemplate;
  for (auto pattern : kTemplatePatterns) {
    if (template_text.find(pattern) != std::string_view::npos) {
      out.issues.push_back("Dangerous template pattern: " + std::string(pattern));
    }
  }
  return out;
}

orchestrator::Event PreflightRejectedEvent(const PreflightResult& result, std::string_view subject_id) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "preflight_rejected";
  event.message = result.RejectionMessage();
  const char* subject = "validator";
  if (result.subject == PreflightSubject::kReporterCode) {
    subject = "reporter";
  } else if (result.subject == PreflightSubject::kTemplate) {
    subject = "template";
  }
  event.fields.emplace_back("subject", subject);
  event.fields.emplace_back("subject_id", std::string(subject_id));
  event.fields.emplace_back("issue_count", std::to_string(result.issues.size()), orchestrator::FieldPrivacy::kPublic,
                            true);
  return event;
}

}  // namespace warden::drivers
