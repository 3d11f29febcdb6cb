#include <algorithm>
#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "warden/analysis/analyzer.h"
#include "warden/crypto/provider.h"
#include "warden/drivers/collaborators.h"
#include "warden/drivers/execution_log.h"
#include "warden/drivers/plugin_loader.h"
#include "warden/drivers/preflight.h"
#include "warden/drivers/reporter_driver.h"
#include "warden/drivers/templates.h"
#include "warden/drivers/validator_driver.h"
#include "warden/error.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/orchestrator/io_util.h"
#include "warden/sandbox/process_engine.h"
#include "warden/sandbox/subprocess.h"

namespace {

using namespace warden::drivers;
using warden::sandbox::FailureKind;

class RecordingAuditSink : public AuditSink {
public:
  void Record(const warden::orchestrator::Event& event) noexcept override { events.push_back(event); }

  std::vector<warden::orchestrator::Event> events;
};

std::string FieldValue(const warden::orchestrator::Event& event, const std::string& key) {
  for (const auto& field : event.fields) {
    if (field.key == key) {
      return field.value;
    }
  }
  return {};
}

bool StateErrorWith(const std::function<void()>& fn, int code) {
  try {
    fn();
  } catch (const warden::Error& err) {
    return err.domain == warden::ErrorDomain::State && err.code == code;
  }
  return false;
}

void TestExecutionLogStore(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  warden::orchestrator::EventBus bus;
  std::vector<std::string> finalized;
  bus.Subscribe([&finalized](const warden::orchestrator::Event& e) { finalized.push_back(e.event_id); });
  InMemoryExecutionLogStore store(&bus);

  ExecutionLog log;
  log.execution_id = NewExecutionId(*crypto);
  assert(log.execution_id.size() == 36);
  assert(log.execution_id[14] == '4');
  log.validator_id = "null_check";
  store.Create(log);
  assert(store.Get(log.execution_id)->status == ExecutionStatus::kRunning);

  store.Complete(log.execution_id, {{"passed", true}, {"issues_count", 0}}, 12.5);
  auto completed = store.Get(log.execution_id);
  assert(completed->status == ExecutionStatus::kCompleted);
  assert(completed->result["passed"] == true);
  assert(completed->memory_used_mb == 12.5);
  assert(!completed->completed_at.empty());
  assert(finalized.size() == 1);

  const auto id = log.execution_id;
  assert(StateErrorWith([&] { store.Fail(id, "late"); }, warden::errors::state::kLogAlreadyFinalized));
  assert(StateErrorWith([&] { store.Complete(id, {}, 0); }, warden::errors::state::kLogAlreadyFinalized));
  assert(StateErrorWith([&] { store.Fail("missing", "x"); }, warden::errors::state::kLogMissing));
  assert(StateErrorWith([&] { store.Create(log); }, warden::errors::state::kLogAlreadyFinalized));
  assert(store.Get(id)->status == ExecutionStatus::kCompleted);

  ExecutionLog second;
  second.execution_id = NewExecutionId(*crypto);
  assert(second.execution_id != id);
  store.Create(second);
  store.Fail(second.execution_id, "Execution failed");
  auto listed = store.List();
  assert(listed.size() == 2);
  assert(listed[0].execution_id == id);
  assert(listed[1].status == ExecutionStatus::kFailed);
  assert(listed[1].error_message == "Execution failed");
  assert(listed[1].ToJson()["status"] == "failed");
}

void TestPreflight() {
  warden::analysis::AnalysisCache cache;
  auto missing = PreflightValidatorCode("x = 1\n", cache, {});
  assert(!missing.passed());
  assert(missing.issues.front() == "Missing required 'validate' function");

  auto dangerous = PreflightValidatorCode(
      "def validate(column_name, values, params, schema, row_count):\n    return eval('True')\n", cache, {});
  assert(!dangerous.passed());
  assert(std::find(dangerous.issues.begin(), dangerous.issues.end(), "Dangerous pattern detected: eval(") !=
         dangerous.issues.end());
  assert(std::find(dangerous.issues.begin(), dangerous.issues.end(), "Blocked function call: eval") !=
         dangerous.issues.end());
  assert(dangerous.RejectionMessage().rfind("Code validation failed: ", 0) == 0);
  assert(dangerous.ToJson()["is_valid"] == false);

  auto starter = PreflightValidatorCode(ValidatorTemplate(), cache, {});
  assert(starter.passed());
  auto reporter_starter = PreflightReporterCode(ReporterTemplate(), cache, {});
  assert(reporter_starter.passed());

  auto reporter = PreflightReporterCode("def render():\n    pass\n", cache, {});
  assert(reporter.issues.front() == "Missing required 'generate_report' function");

  auto tmpl = PreflightTemplate("<p>{{ title }}</p>{% include 'x.html' %}");
  assert(!tmpl.passed());
  assert(tmpl.issues.front() == "Dangerous template pattern: {% include");
  assert(tmpl.RejectionMessage() == "Template validation failed: Dangerous template pattern: {% include");
  assert(PreflightTemplate(ReportHtmlTemplate()).passed());

  auto event = PreflightRejectedEvent(tmpl, "html_report");
  assert(event.event_id == "preflight_rejected");
  assert(event.category == warden::orchestrator::EventCategory::kSecurity);
  assert(FieldValue(event, "subject_id") == "html_report");
  assert(FieldValue(event, "issue_count") == "1");
}

void TestPluginLoader() {
  warden::orchestrator::PrivateTempDir scratch("warden_plugins_");
  const auto dir = scratch.path() / "null_check";
  std::filesystem::create_directories(dir);
  warden::orchestrator::AtomicReplace(dir / "validate.py", ValidatorTemplate());
  warden::orchestrator::AtomicReplace(dir / kManifestFileName,
                                      std::string_view("# null checker\n"
                                                       "id = null_check\n"
                                                       "version = 1.0.0\n"
                                                       "kind = validator\n"
                                                       "code_file = validate.py\n"
                                                       "permission = file_system\n"
                                                       "signature = hmac_sha256:s1:abcd:1700000000\n"));
  std::filesystem::create_directories(scratch.path() / "not_a_plugin");

  DirectoryPluginLoader loader(scratch.path());
  auto ids = loader.List();
  assert(ids.size() == 1 && ids[0] == "null_check");

  auto manifest = loader.Load("null_check");
  assert(manifest.name == "null_check");
  assert(manifest.kind == PluginKind::kValidator);
  assert(manifest.code == ValidatorTemplate());
  assert(manifest.SignedPayload() == manifest.code);
  assert(manifest.permissions.size() == 1);
  assert(manifest.signatures.size() == 1);
  assert(manifest.signatures[0].signer_id == "s1");
  assert(manifest.signatures[0].timestamp == 1700000000);

  auto expect_validation = [](const std::function<void()>& fn, const std::string& fragment) {
    bool threw = false;
    try {
      fn();
    } catch (const warden::Error& err) {
      threw = err.domain == warden::ErrorDomain::Validation &&
              std::string(err.what()).find(fragment) != std::string::npos;
    }
    assert(threw);
  };
  expect_validation([&] { (void)loader.Load("../etc"); }, "Invalid plugin id");

  const auto escape = scratch.path() / "escape";
  std::filesystem::create_directories(escape);
  warden::orchestrator::AtomicReplace(escape / kManifestFileName,
                                      std::string_view("id = escape\ncode_file = ../null_check/validate.py\n"));
  expect_validation([&] { (void)loader.Load("escape"); }, "line 2");

  const auto renamed = scratch.path() / "renamed";
  std::filesystem::create_directories(renamed);
  warden::orchestrator::AtomicReplace(renamed / kManifestFileName,
                                      std::string_view("id = other\ntemplate_file = t.html\n"));
  warden::orchestrator::AtomicReplace(renamed / "t.html", std::string_view("<p>{{ title }}</p>"));
  expect_validation([&] { (void)loader.Load("renamed"); }, "does not match directory name");

  InMemoryPluginLoader memory;
  PluginManifest html;
  html.id = "html_report";
  html.kind = PluginKind::kReporter;
  html.template_text = "<p>{{ title }}</p>";
  memory.Add(html);
  assert(memory.Load("html_report").SignedPayload() == "<p>{{ title }}</p>");
  expect_validation([&] { (void)memory.Load("absent"); }, "Unknown plugin: absent");
}

warden::sandbox::SandboxConfig DriverConfig() {
  warden::sandbox::SandboxConfig config;
  config.wall_time_limit_sec = 20;
  config.cpu_time_limit_sec = 20;
  return config;
}

void TestValidatorDriver(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  warden::sandbox::ProcessEngine engine(DriverConfig(), crypto);
  warden::analysis::AnalysisCache cache;
  InMemoryExecutionLogStore logs;
  InMemoryUsageCounters usage;
  RecordingAuditSink audit;
  ValidatorDriver driver(engine, cache, crypto, &logs, &usage, &audit);

  ValidatorDefinition null_check{"null_check", "quality_pack", std::string(ValidatorTemplate())};
  ValidatorContext context;
  context.column_name = "age";
  context.values = {1, nullptr, 3};
  context.row_count = 3;

  auto result = driver.Execute(null_check, context, "customers.csv");
  assert(result.failure == FailureKind::kNone);
  assert(!result.passed);
  assert(result.issues.size() == 1);
  assert(result.details["null_count"] == 1);
  assert(result.details["total_values"] == 3);
  assert(result.message == "Validation completed with 1 issues");
  assert(usage.Count(UsageKind::kValidator, "null_check") == 1);
  assert(usage.Count(UsageKind::kPlugin, "quality_pack") == 1);

  auto log = logs.Get(result.execution_id);
  assert(log);
  assert(log->status == ExecutionStatus::kFailed);
  assert(log->source_id == "customers.csv");
  assert(log->error_message == "Validation completed with 1 issues");

  context.values = {1, 2, 3};
  auto clean = driver.Execute(null_check, context);
  assert(clean.passed);
  assert(clean.issues.empty());
  auto clean_log = logs.Get(clean.execution_id);
  assert(clean_log && clean_log->status == ExecutionStatus::kCompleted);
  assert(clean_log->result["passed"] == true);
  assert(clean_log->result["issues_count"] == 0);

  ValidatorDefinition boolean{"always", "", "def validate(column_name, values, params, schema, row_count):\n"
                                            "    return row_count == len(values)\n"};
  auto verdict = driver.Execute(boolean, context);
  assert(verdict.passed);
  assert(verdict.message == "Validation passed");
  assert(usage.Count(UsageKind::kValidator, "always") == 1);

  ValidatorDefinition crashing{"crashing", "", "def validate(column_name, values, params, schema, row_count):\n"
                                               "    return values[10]\n"};
  auto crashed = driver.Execute(crashing, context);
  assert(!crashed.passed);
  assert(crashed.failure == FailureKind::kExecutionFailure);
  assert(crashed.details["error_type"] == "IndexError");
  assert(logs.Get(crashed.execution_id)->status == ExecutionStatus::kFailed);

  // Pre-flight rejection never reaches the sandbox or the usage counters.
  ValidatorDefinition hostile{"hostile", "hostile_pack",
                              "import os\n"
                              "def validate(column_name, values, params, schema, row_count):\n"
                              "    return os.system('true') == 0\n"};
  auto rejected = driver.Execute(hostile, context);
  assert(!rejected.passed);
  assert(rejected.failure == FailureKind::kSecurityViolation);
  assert(rejected.message.rfind("Code validation failed: ", 0) == 0);
  assert(rejected.message.find("Blocked module import: os") != std::string::npos);
  assert(usage.Count(UsageKind::kValidator, "hostile") == 0);
  assert(usage.Count(UsageKind::kPlugin, "hostile_pack") == 0);
  auto rejected_log = logs.Get(rejected.execution_id);
  assert(rejected_log->status == ExecutionStatus::kFailed);
  assert(rejected_log->error_message == rejected.message);
  assert(audit.events.size() == 1);
  assert(audit.events[0].event_id == "preflight_rejected");
  assert(FieldValue(audit.events[0], "subject_id") == "hostile");

  auto dry_run = driver.TestValidator(ValidatorTemplate(), {{"values", {nullptr, nullptr}}}, nullptr);
  assert(dry_run["success"] == true);
  assert(dry_run["passed"] == false);
  assert(dry_run["result"]["details"]["null_count"] == 2);
  auto dry_rejected = driver.TestValidator("x = 1\n", nlohmann::json::array(), {});
  assert(dry_rejected["success"] == false);
  assert(dry_rejected["passed"].is_null());
  auto private_access = driver.TestValidator(
      "import random\n"
      "def validate(column_name, values, params, schema, row_count):\n"
      "    return len(random._os.listdir('/')) > 0\n",
      nlohmann::json::array(), {});
  assert(private_access["success"] == false);
  assert(private_access["error"].get<std::string>().find("Private attribute access: _os") != std::string::npos);
  assert(logs.size() == 5);
}

void TestReporterDriver(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  warden::sandbox::ProcessEngine engine(DriverConfig(), crypto);
  warden::analysis::AnalysisCache cache;
  InMemoryExecutionLogStore logs;
  InMemoryUsageCounters usage;
  RecordingAuditSink audit;
  ReporterDriver driver(engine, cache, crypto, &logs, &usage, &audit);

  ReportContext context;
  context.data = {{"title", "Run 42"}};

  ReporterDefinition by_template{"html_report", "", MakeRenderer("<h1>{{ title }}</h1>", "")};
  auto rendered = driver.Execute(by_template, context);
  assert(rendered.success);
  assert(rendered.content == "<h1>Run 42</h1>");
  assert(rendered.content_type == "text/html");
  assert(rendered.filename == "report.html");
  assert(logs.Get(rendered.execution_id)->status == ExecutionStatus::kCompleted);
  assert(usage.Count(UsageKind::kReporter, "html_report") == 1);

  ReporterDefinition by_code{"code_report", "", MakeRenderer("", "def generate_report(data, config, format, metadata):\n"
                                                                 "    return '<h1>' + data['title'] + '</h1>'\n")};
  auto coded = driver.Execute(by_code, context);
  assert(coded.success);
  assert(coded.content == "<h1>Run 42</h1>");
  assert(coded.content_type == "text/html");

  context.format = "markdown";
  ReporterDefinition markdown{"md_report", "", MakeRenderer("# {{ title }}", "ignored")};
  auto md = driver.Execute(markdown, context);
  assert(md.success);
  assert(md.content == "# Run 42");
  assert(md.content_type == "text/markdown");
  assert(md.filename == "report.md");

  ReporterDefinition empty{"empty_report", "", MakeRenderer("", "")};
  auto nothing = driver.Execute(empty, context);
  assert(!nothing.success);
  assert(nothing.error == "Reporter has no template or code");
  assert(usage.Count(UsageKind::kReporter, "empty_report") == 0);

  ReporterDefinition hostile{"hostile_report", "", MakeRenderer("{{ config.__class__ }}", "")};
  auto rejected = driver.Execute(hostile, context);
  assert(!rejected.success);
  assert(rejected.failure == FailureKind::kSecurityViolation);
  assert(rejected.error.rfind("Template validation failed: ", 0) == 0);
  assert(usage.Count(UsageKind::kReporter, "hostile_report") == 0);
  assert(audit.events.size() == 1);
  assert(logs.Get(rejected.execution_id)->status == ExecutionStatus::kFailed);

  const auto logged = logs.size();
  auto preview = driver.PreviewReport(std::string_view("{{ message }} {{ metadata.is_preview }}"), std::nullopt);
  assert(preview.success);
  assert(preview.content == "Sample report data True");
  assert(preview.execution_id.empty());
  assert(logs.size() == logged);

  auto none = driver.PreviewReport(std::nullopt, std::nullopt);
  assert(!none.success);
  assert(none.error == "No template or code provided");
}

}  // namespace

int main() {
  auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();

  TestExecutionLogStore(crypto);
  TestPreflight();
  TestPluginLoader();

  if (!warden::sandbox::ResolvePythonExecutable("")) {
    std::cout << "python3 not found; skipping driver execution tests\n";
    std::cout << "driver tests ok\n";
    return 0;
  }

  TestValidatorDriver(crypto);
  TestReporterDriver(crypto);

  std::cout << "driver tests ok\n";
  return 0;
}
