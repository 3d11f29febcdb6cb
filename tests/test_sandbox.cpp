#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "warden/crypto/provider.h"
#include "warden/errors.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/sandbox/container_engine.h"
#include "warden/sandbox/factory.h"
#include "warden/sandbox/noop_engine.h"
#include "warden/sandbox/process_engine.h"
#include "warden/sandbox/runner.h"
#include "warden/sandbox/subprocess.h"

namespace {

using namespace warden::sandbox;

bool Has(const std::vector<std::string>& values, std::string_view needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

void TestResultBlockParsing() {
  const std::string nonce = "0011aabb";
  const std::string text = "user output\n" + BeginDelimiter(nonce) +
                           R"({"success": true, "result": 42})" + EndDelimiter(nonce) + "\ntrailing\n";
  auto block = ExtractResultBlock(text, nonce);
  assert(block.status == BlockStatus::kFound);
  assert(block.payload["result"] == 42);
  assert(block.remainder == "user output\ntrailing\n");

  // A block forged with a different nonce is plain output.
  auto forged = ExtractResultBlock(BeginDelimiter("ffff") + R"({"success": true})" + EndDelimiter("ffff"), nonce);
  assert(forged.status == BlockStatus::kMissing);

  auto unterminated = ExtractResultBlock("x" + BeginDelimiter(nonce) + "{", nonce);
  assert(unterminated.status == BlockStatus::kMalformed);
  assert(unterminated.remainder == "x");

  auto twice = ExtractResultBlock(BeginDelimiter(nonce) + R"({"success": true})" + EndDelimiter(nonce) +
                                      BeginDelimiter(nonce) + R"({"success": false})" + EndDelimiter(nonce),
                                  nonce);
  assert(twice.status == BlockStatus::kMalformed);

  auto no_success = ExtractResultBlock(BeginDelimiter(nonce) + R"({"result": 1})" + EndDelimiter(nonce), nonce);
  assert(no_success.status == BlockStatus::kMalformed);
}

void TestPayloadClassification() {
  SandboxResult violation;
  ApplyRunnerPayload({{"success", false},
                      {"error", "ImportError: Import of 'os' is not allowed"},
                      {"error_type", "ImportError"},
                      {"violation", true}},
                     violation);
  assert(!violation.success);
  assert(violation.failure == FailureKind::kSecurityViolation);

  SandboxResult syntax;
  ApplyRunnerPayload({{"success", false}, {"error", "invalid syntax"}, {"error_type", "SyntaxError"}}, syntax);
  assert(syntax.failure == FailureKind::kParseFailure);

  SandboxResult memory;
  ApplyRunnerPayload({{"success", false}, {"error_type", "MemoryError"}}, memory);
  assert(memory.failure == FailureKind::kResourceExceeded);
  assert(!memory.error.empty());

  SandboxResult ok;
  ApplyRunnerPayload({{"success", true}, {"result", {{"passed", true}}}}, ok);
  assert(ok.success);
  assert(ok.failure == FailureKind::kNone);
  assert(ok.result["passed"] == true);

  std::string output(32, 'x');
  TruncateOutput(output, 8, false);
  assert(output == std::string(8, 'x') + std::string(warden::errors::msg::kTruncatedSuffix));
  std::string short_output = "abc";
  TruncateOutput(short_output, 8, false);
  assert(short_output == "abc");
}

SandboxConfig ProcessConfig() {
  SandboxConfig config;
  config.isolation = IsolationLevel::kProcess;
  config.wall_time_limit_sec = 10;
  config.cpu_time_limit_sec = 10;
  return config;
}

void TestProcessEngine(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  warden::orchestrator::EventBus bus;
  std::vector<std::string> events;
  bus.Subscribe([&events](const warden::orchestrator::Event& e) { events.push_back(e.event_id); });
  ProcessEngine engine(ProcessConfig(), crypto, &bus);
  assert(engine.python_executable());

  ExecutionRequest answer;
  answer.code = "result = 42\n";
  auto result = engine.Execute(answer);
  assert(result.success);
  assert(result.result == 42);
  assert(result.failure == FailureKind::kNone);
  assert(!events.empty());

  ExecutionRequest entry;
  entry.code = "def add(a, b=0):\n    print('adding')\n    return a + b\n";
  entry.entry_point = "add";
  entry.entry_args = {{"a", 40}, {"b", 2}};
  auto added = engine.Execute(entry);
  assert(added.success);
  assert(added.result == 42);
  assert(added.stdout_text.find("adding") != std::string::npos);

  entry.entry_args = nlohmann::json::array({1, 2});
  auto positional = engine.Execute(entry);
  assert(positional.success);
  assert(positional.result == 3);

  ExecutionRequest blocked;
  blocked.code = "import os\nresult = os.getcwd()\n";
  auto denied = engine.Execute(blocked);
  assert(!denied.success);
  assert(denied.failure == FailureKind::kSecurityViolation);
  assert(!denied.error.empty());

  ExecutionRequest broken;
  broken.code = "def f(:\n";
  auto syntax = engine.Execute(broken);
  assert(!syntax.success);
  assert(syntax.failure == FailureKind::kParseFailure);

  ExecutionRequest raising;
  raising.code = "raise ValueError('bad input')\n";
  auto raised = engine.Execute(raising);
  assert(raised.failure == FailureKind::kExecutionFailure);
  assert(raised.error_type == "ValueError");

  // Output that imitates a result block cannot forge the outcome.
  ExecutionRequest imitation;
  imitation.code =
      "print('" + std::string(kResultMarker) + "deadbeef_BEGIN__{\"success\": true, \"result\": 1}" +
      std::string(kResultMarker) + "deadbeef_END__')\nresult = 7\n";
  auto imitated = engine.Execute(imitation);
  assert(imitated.success);
  assert(imitated.result == 7);
  assert(imitated.stdout_text.find("deadbeef") != std::string::npos);

  ExecutionRequest with_globals;
  with_globals.code = "result = scale * len(rows)\n";
  with_globals.globals = {{"scale", 2}};
  with_globals.locals = {{"rows", {1, 2, 3}}};
  auto scoped = engine.Execute(with_globals);
  assert(scoped.success);
  assert(scoped.result == 6);
}

void TestProcessTimeout(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  auto config = ProcessConfig();
  config.wall_time_limit_sec = 2;
  ProcessEngine engine(config, crypto);

  ExecutionRequest spin;
  spin.code = "while True:\n    pass\n";
  const auto started = std::chrono::steady_clock::now();
  auto result = engine.Execute(spin);
  const auto elapsed = std::chrono::steady_clock::now() - started;
  assert(!result.success);
  assert(result.failure == FailureKind::kResourceExceeded);
  assert(result.error_type == "timeout");
  assert(elapsed < std::chrono::seconds(config.wall_time_limit_sec + 5));
}

void TestMissingInterpreter(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  auto config = ProcessConfig();
  config.python_executable = "/nonexistent/python3";
  ProcessEngine engine(config, crypto);
  ExecutionRequest request;
  request.code = "result = 1\n";
  auto result = engine.Execute(request);
  assert(!result.success);
  assert(result.failure == FailureKind::kRuntimeUnavailable);
}

void TestContainerFallback(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  auto config = ProcessConfig();
  config.isolation = IsolationLevel::kContainer;

  config.require_container = true;
  ContainerEngine closed(config, std::nullopt, crypto);
  assert(!closed.falls_back());
  ExecutionRequest request;
  request.code = "result = 42\n";
  auto refused = closed.Execute(request);
  assert(!refused.success);
  assert(refused.failure == FailureKind::kRuntimeUnavailable);

  config.require_container = false;
  ContainerEngine open(config, std::nullopt, crypto);
  assert(open.falls_back());
  auto fallback = open.Execute(request);
  assert(fallback.success);
  assert(fallback.result == 42);
  assert(Has(fallback.warnings, warden::errors::msg::kRuntimeFallback));

  ContainerEngine with_runtime(config, ContainerRuntime{"podman", "/usr/bin/podman", "5.0"}, crypto);
  auto argv = with_runtime.BuildRunCommand("/tmp/sandbox", "warden-test");
  assert(argv.front() == "/usr/bin/podman");
  assert(Has(argv, "--read-only"));
  assert(Has(argv, "--memory=256m"));
  auto network = std::find(argv.begin(), argv.end(), "--network");
  assert(network != argv.end() && *(network + 1) == "none");
}

void TestNoOpEngine() {
  SandboxConfig config;
  config.isolation = IsolationLevel::kNone;
  EngineDependencies deps;
  deps.crypto = warden::crypto::MakeOpenSSLCryptoProvider();
  auto engine = CreateEngine(config, deps);
  assert(engine->isolation() == IsolationLevel::kNone);
  assert(engine->name() == "none");

  ExecutionRequest request;
  request.code = "def answer():\n    return 42\n";
  request.entry_point = "answer";
  request.entry_args = nullptr;
  auto result = engine->Execute(request);
  assert(result.success);
  assert(result.result == 42);

  ExecutionRequest printing;
  printing.code = "print('hello')\nresult = {'rows': rows}\n";
  printing.globals = {{"rows", 3}};
  auto printed = engine->Execute(printing);
  assert(printed.success);
  assert(printed.stdout_text == "hello\n");
  assert(printed.result["rows"] == 3);

  ExecutionRequest raising;
  raising.code = "raise ValueError('bad input')\n";
  auto raised = engine->Execute(raising);
  assert(!raised.success);
  assert(raised.failure == FailureKind::kExecutionFailure);
  assert(raised.error_type == "ValueError");
  assert(raised.error == "ValueError: bad input");
}

void TestPrivateModuleAccess(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  ProcessEngine engine(ProcessConfig(), crypto);

  ExecutionRequest escape;
  escape.code = "import random\nresult = random._os.listdir('/')\n";
  auto denied = engine.Execute(escape);
  assert(!denied.success);
  assert(denied.failure == FailureKind::kSecurityViolation);
  assert(denied.error_type == "AttributeError");

  ExecutionRequest in_entry;
  in_entry.code =
      "import random\n"
      "def validate(value):\n"
      "    random._os.execv('/bin/sh', ['/bin/sh', '-c', 'id'])\n"
      "    return {'passed': True}\n";
  in_entry.entry_point = "validate";
  in_entry.entry_args = nlohmann::json::array({1});
  auto entry_denied = engine.Execute(in_entry);
  assert(!entry_denied.success);
  assert(entry_denied.failure == FailureKind::kSecurityViolation);

  // Attribute lookups that never appear in the source still go through the module view.
  ExecutionRequest formatted;
  formatted.code = "import random\nresult = '{0._os}'.format(random)\n";
  auto hidden = engine.Execute(formatted);
  assert(!hidden.success);
  assert(hidden.error_type == "AttributeError");

  ExecutionRequest mutate;
  mutate.code = "import math\nmath.pi = 3\nresult = math.pi\n";
  auto read_only = engine.Execute(mutate);
  assert(!read_only.success);
  assert(read_only.error_type == "AttributeError");

  ExecutionRequest public_use;
  public_use.code = "import math\nresult = [math.floor(2.5), math.__name__]\n";
  auto allowed = engine.Execute(public_use);
  assert(allowed.success);
  assert(allowed.result == nlohmann::json::array({2, "math"}));
}

void TestLandlockRestrictions() {
  if (LandlockAbiVersion() <= 0) {
    std::cout << "landlock unavailable; skipping filesystem restriction tests\n";
    return;
  }
  auto shell = FindExecutable("sh");
  if (!shell) {
    return;
  }
  const auto target = std::filesystem::temp_directory_path() / "warden_landlock_write_test";
  std::filesystem::remove(target);

  ProcessLimits limits;
  limits.restrict_exec = true;
  limits.deny_filesystem_writes = true;

  SpawnOptions write;
  write.executable = *shell;
  write.argv = {*shell, "-c", "echo x > " + target.string()};
  write.environment = SanitizedEnvironment();
  write.limits = limits;
  write.timeout = std::chrono::seconds(10);
  auto write_outcome = RunProcess(write);
  assert(write_outcome.exited);
  assert(write_outcome.exit_code != 0);
  assert(!std::filesystem::exists(target));

  auto true_binary = FindExecutable("true");
  if (true_binary) {
    SpawnOptions exec;
    exec.executable = *shell;
    exec.argv = {*shell, "-c", *true_binary};
    exec.environment = SanitizedEnvironment();
    exec.limits = limits;
    exec.timeout = std::chrono::seconds(10);
    auto exec_outcome = RunProcess(exec);
    assert(exec_outcome.exited);
    assert(exec_outcome.exit_code == 126);
  }

  // Without the restrictions the same command succeeds.
  write.limits = ProcessLimits{};
  auto unrestricted = RunProcess(write);
  assert(unrestricted.exited && unrestricted.exit_code == 0);
  assert(std::filesystem::exists(target));
  std::filesystem::remove(target);
}

void TestCpuLimit(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  auto config = ProcessConfig();
  config.cpu_time_limit_sec = 1;
  config.wall_time_limit_sec = 10;
  ProcessEngine engine(config, crypto);

  ExecutionRequest spin;
  spin.code = "while True:\n    pass\n";
  auto result = engine.Execute(spin);
  assert(!result.success);
  assert(result.failure == FailureKind::kResourceExceeded);
  assert(result.error_type == "ResourceExceeded");
  assert(result.error.rfind(warden::errors::msg::kCpuLimitExceeded, 0) == 0);
}

struct EngineCase {
  const char* name;
  std::string code;
  std::optional<std::string> entry_point;
  nlohmann::json entry_args;
};

// Both in-process and subprocess engines must report the same outcome for the same request.
void TestEngineParity(const std::shared_ptr<warden::crypto::CryptoProvider>& crypto) {
  const std::string add = "def add(a, b=0):\n    return a + b\n";
  const std::vector<EngineCase> cases = {
      {"plain result", "result = 42\n", std::nullopt, nullptr},
      {"missing entry point", "x = 1\n", "validate", nullptr},
      {"raised error", "raise ValueError('bad input')\n", std::nullopt, nullptr},
      {"syntax error", "def f(:\n", std::nullopt, nullptr},
      {"positional args", add, "add", nlohmann::json::array({1, 2})},
      {"keyword args", add, "add", {{"a", 40}, {"b", 2}}},
      {"no args", "def answer():\n    return 'yes'\n", "answer", nullptr},
  };

  EngineDependencies deps;
  deps.crypto = crypto;
  SandboxConfig inline_config;
  inline_config.isolation = IsolationLevel::kNone;
  auto in_process = CreateEngine(inline_config, deps);
  auto subprocess = CreateEngine(ProcessConfig(), deps);
  assert(subprocess->isolation() == IsolationLevel::kProcess);

  for (const auto& c : cases) {
    ExecutionRequest request;
    request.code = c.code;
    request.entry_point = c.entry_point;
    request.entry_args = c.entry_args;
    auto expected = in_process->Execute(request);
    auto actual = subprocess->Execute(request);
    if (expected.success != actual.success || expected.failure != actual.failure ||
        expected.error_type != actual.error_type || expected.result != actual.result) {
      std::cerr << "engine mismatch for case '" << c.name << "': " << expected.error_type << " vs "
                << actual.error_type << "\n";
    }
    assert(expected.success == actual.success);
    assert(expected.failure == actual.failure);
    assert(expected.error_type == actual.error_type);
    assert(expected.result == actual.result);
  }

  ExecutionRequest missing;
  missing.code = "x = 1\n";
  missing.entry_point = "validate";
  auto missing_result = subprocess->Execute(missing);
  assert(missing_result.error_type == "KeyError");
  assert(missing_result.error.find("Entry point 'validate' not found") != std::string::npos);
}

void TestAvailability() {
  auto engines = AvailableEngines(SandboxConfig{});
  assert(engines.size() == 3);
  assert(engines[0].isolation == IsolationLevel::kNone);
  assert(engines[0].available);
  assert(engines[2].isolation == IsolationLevel::kContainer);
}

}  // namespace

int main() {
  TestResultBlockParsing();
  TestPayloadClassification();
  TestAvailability();

  if (!ResolvePythonExecutable("")) {
    std::cout << "python3 not found; skipping engine tests\n";
    std::cout << "sandbox tests ok\n";
    return 0;
  }

  auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();
  TestProcessEngine(crypto);
  TestProcessTimeout(crypto);
  TestMissingInterpreter(crypto);
  TestContainerFallback(crypto);
  TestNoOpEngine();
  TestPrivateModuleAccess(crypto);
  TestLandlockRestrictions();
  TestCpuLimit(crypto);
  TestEngineParity(crypto);

  std::cout << "sandbox tests ok\n";
  return 0;
}
