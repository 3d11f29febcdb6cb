#include <algorithm>
#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "warden/error.h"
#include "warden/orchestrator/config.h"
#include "warden/orchestrator/io_util.h"
#include "warden/trust/policy.h"
#include "warden/trust/security_analyzer.h"

namespace {

using warden::sandbox::IsolationLevel;
using warden::trust::GetPreset;
using warden::trust::PolicyOverrides;
using warden::trust::SecurityPolicy;

bool Contains(const std::vector<std::string>& values, const std::string& needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

bool ThrowsConfig(const std::string& text, const std::string& fragment) {
  try {
    (void)warden::orchestrator::ParseConfig(text);
  } catch (const warden::Error& err) {
    return err.domain == warden::ErrorDomain::Config &&
           std::string(err.what()).find(fragment) != std::string::npos;
  }
  return false;
}

void TestPresetsTighten() {
  const auto& names = warden::trust::PresetNames();
  assert(names.size() == 6);
  assert(names.front() == "development");
  assert(names.back() == "airgapped");

  for (size_t i = 1; i < names.size(); ++i) {
    auto looser = GetPreset(names[i - 1]);
    auto tighter = GetPreset(names[i]);
    assert(tighter.memory_limit_mb <= looser.memory_limit_mb);
    assert(tighter.cpu_time_limit_sec <= looser.cpu_time_limit_sec);
    assert(tighter.min_signatures >= looser.min_signatures);
    assert(static_cast<int>(tighter.isolation) >= static_cast<int>(looser.isolation));
    for (const auto& module : looser.blocked_modules) {
      assert(Contains(tighter.blocked_modules, module));
    }
  }

  auto development = GetPreset("development");
  assert(development.isolation == IsolationLevel::kNone);
  assert(development.allow_network);
  assert(!development.require_signature);

  auto strict = GetPreset("strict");
  assert(strict.isolation == IsolationLevel::kContainer);
  assert(strict.require_container);
  assert(strict.min_signatures == 2);
  assert(Contains(strict.blocked_modules, "inspect"));

  auto summaries = warden::trust::ListPresets();
  assert(summaries.size() == names.size());
  assert(summaries[2].name == "standard");
  assert(summaries[2].require_signature);
}

void TestPresetsAreCopies() {
  auto standard = GetPreset("standard");
  standard.memory_limit_mb = 1;
  standard.blocked_modules.clear();
  auto fresh = GetPreset("standard");
  assert(fresh.memory_limit_mb == 256);
  assert(!fresh.blocked_modules.empty());
}

void TestOverrides() {
  PolicyOverrides overrides;
  overrides.Set("memory_limit_mb", "128");
  overrides.Set("isolation", "container");
  overrides.Set("allow_network", "yes");
  overrides.Set("blocked_modules", "numpy,pandas");
  auto policy = warden::trust::CreatePolicy("standard", overrides);
  assert(policy.memory_limit_mb == 128);
  assert(policy.isolation == IsolationLevel::kContainer);
  assert(policy.allow_network);
  assert(policy.cpu_time_limit_sec == 30);
  assert(policy.name == "standard");

  auto sandbox_config = policy.ToSandboxConfig();
  assert(sandbox_config.memory_limit_mb == 128);
  assert(Contains(sandbox_config.blocked_modules, "numpy"));
  assert(Contains(sandbox_config.blocked_modules, "os"));

  auto expect_throw = [](const char* field, const char* value, const std::string& fragment) {
    PolicyOverrides bad;
    bool threw = false;
    try {
      bad.Set(field, value);
    } catch (const warden::Error& err) {
      threw = err.domain == warden::ErrorDomain::Config &&
              std::string(err.what()).find(fragment) != std::string::npos;
    }
    assert(threw);
  };
  expect_throw("memory_limit_mb", "lots", "Invalid value for memory_limit_mb");
  expect_throw("isolation", "vm", "Invalid isolation level: vm");
  expect_throw("gpu_count", "1", "Unknown policy field: gpu_count");

  bool unknown = false;
  try {
    (void)GetPreset("paranoid");
  } catch (const warden::Error& err) {
    unknown = std::string(err.what()) == "Unknown security preset: paranoid";
  }
  assert(unknown);
}

void TestValidateForPolicy() {
  warden::trust::SecurityReport report;
  report.plugin_id = "unsigned";
  report.can_run_in_sandbox = true;

  auto development = GetPreset("development");
  assert(warden::trust::ValidateForPolicy(report, development, IsolationLevel::kNone).empty());

  auto strict = GetPreset("strict");
  auto violations = warden::trust::ValidateForPolicy(report, strict, strict.isolation);
  assert(Contains(violations, "Plugin requires valid signature"));
  assert(Contains(violations, "Insufficient signatures: 0 < 2"));

  report.signature_valid = true;
  report.signature_count = 2;
  report.can_run_in_sandbox = false;
  violations = warden::trust::ValidateForPolicy(report, strict, strict.isolation);
  assert(violations.size() == 1);
  assert(violations[0] == "Plugin not compatible with required isolation level");
  assert(warden::trust::ValidateForPolicy(report, strict, IsolationLevel::kNone).empty());

  warden::analysis::AnalysisResult analysis;
  analysis.issues.push_back("Blocked function call: exec");
  report.can_run_in_sandbox = true;
  report.code_analysis = analysis;
  violations = warden::trust::ValidateForPolicy(report, strict, strict.isolation);
  assert(Contains(violations, "Code analysis found 1 critical issues"));
}

void TestParseConfig() {
  const std::string text =
      "# warden.conf\n"
      "policy = enterprise\n"
      "python = /usr/bin/python3\n"
      "container_runtime = podman\n"
      "container_fail_closed = false\n"
      "audit_log = /var/log/warden/audit.log\n"
      "audit_log_max_bytes = 4096\n"
      "audit_key = 00112233\n"
      "blocked_module = numpy\n"
      "override.memory_limit_mb = 64\n"
      "override.isolation = container\n"
      "override.require_container = true\n";
  auto config = warden::orchestrator::ParseConfig(text);
  assert(config.policy == "enterprise");
  assert(config.python == "/usr/bin/python3");
  assert(config.container_runtime == "podman");
  assert(!config.container_fail_closed);
  assert(config.audit_log == "/var/log/warden/audit.log");
  assert(config.audit_log_max_bytes == 4096);
  assert(config.audit_key.size() == 4);

  auto policy = config.ResolvePolicy();
  assert(policy.memory_limit_mb == 64);
  assert(policy.isolation == IsolationLevel::kContainer);
  // Fail-open configuration wins over the override.
  assert(!policy.require_container);
  assert(Contains(policy.blocked_modules, "numpy"));
  assert(Contains(policy.blocked_modules, "builtins"));

  auto sandbox_config = config.ResolveSandboxConfig(policy);
  assert(sandbox_config.python_executable == "/usr/bin/python3");
  assert(sandbox_config.container_runtime == "podman");
  assert(sandbox_config.memory_limit_mb == 64);
  assert(!sandbox_config.require_container);

  assert(ThrowsConfig("policy = standard\nbogus = 1\n", "config line 2: unknown key 'bogus'"));
  assert(ThrowsConfig("policy = paranoid\n", "config line 1"));
  assert(ThrowsConfig("\n\ncontainer_runtime = lxc\n", "config line 3"));
  assert(ThrowsConfig("audit_log_max_bytes = -1\n", "non-negative integer"));
  assert(ThrowsConfig("override.memory_limit_mb = big\n", "config line 1"));
  assert(ThrowsConfig("just words\n", "expected key=value"));
}

void TestEnvironment() {
  warden::orchestrator::PrivateTempDir scratch("warden_policy_");
  auto path = scratch.path() / "warden.conf";
  warden::orchestrator::AtomicReplace(path, std::string_view("policy = strict\npython = /opt/py\n"));

  ::setenv(warden::orchestrator::kConfigEnv, path.c_str(), 1);
  ::setenv(warden::orchestrator::kPythonEnv, "/usr/local/bin/python3", 1);
  ::setenv(warden::orchestrator::kAuditLogMaxSizeEnv, "2048", 1);
  auto config = warden::orchestrator::LoadConfigFromEnvironment(std::nullopt);
  assert(config.policy == "strict");
  assert(config.python == "/usr/local/bin/python3");
  assert(config.audit_log_max_bytes == 2048);

  ::setenv(warden::orchestrator::kAuditLogMaxSizeEnv, "0", 1);
  bool threw = false;
  try {
    (void)warden::orchestrator::LoadConfigFromEnvironment(std::nullopt);
  } catch (const warden::Error& err) {
    threw = err.domain == warden::ErrorDomain::Config;
  }
  assert(threw);

  ::unsetenv(warden::orchestrator::kConfigEnv);
  ::unsetenv(warden::orchestrator::kPythonEnv);
  ::unsetenv(warden::orchestrator::kAuditLogMaxSizeEnv);
  auto defaults = warden::orchestrator::LoadConfigFromEnvironment(std::nullopt);
  assert(defaults.policy == "standard");
  assert(defaults.python.empty());

  bool missing = false;
  try {
    (void)warden::orchestrator::LoadConfigFromEnvironment(scratch.path() / "absent.conf");
  } catch (const warden::Error& err) {
    missing = err.domain == warden::ErrorDomain::IO;
  }
  assert(missing);
}

}  // namespace

int main() {
  TestPresetsTighten();
  TestPresetsAreCopies();
  TestOverrides();
  TestValidateForPolicy();
  TestParseConfig();
  TestEnvironment();

  std::cout << "policy tests ok\n";
  return 0;
}
