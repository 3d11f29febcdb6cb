#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "warden/analysis/analyzer.h"
#include "warden/common.h"
#include "warden/crypto/provider.h"
#include "warden/drivers/plugin_loader.h"
#include "warden/drivers/reporter_driver.h"
#include "warden/drivers/templates.h"
#include "warden/drivers/validator_driver.h"
#include "warden/error.h"
#include "warden/orchestrator/config.h"
#include "warden/orchestrator/context.h"
#include "warden/orchestrator/event_bus.h"
#include "warden/orchestrator/io_util.h"
#include "warden/sandbox/factory.h"
#include "warden/trust/policy.h"
#include "warden/trust/signing.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitSandboxFailure = 1;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitAuth = 77;

  void PrintUsage() {
    std::cerr << "Warden: sandboxed plugin execution and trust verification\n";
    std::cerr << "Usage:\n";
    std::cerr << "  warden [global flags] <command> [args]\n";
    std::cerr << "\nCommands:\n";
    std::cerr << "  analyze <code.py>\n";
    std::cerr << "  run <code.py> [--entry=<name>] [--args=<json>] [--globals=<json>] [--isolation=<level>]\n";
    std::cerr << "  validate <validator.py> <data.json> [--params=<json>] [--dry-run]\n";
    std::cerr << "  report <reporter.py|template> [--template] [--data=<json file>] [--format=<fmt>]\n";
    std::cerr << "         [--settings=<json>] [--output=<path>] [--preview]\n";
    std::cerr << "  sign <file> --signer=<id> (--key=<hex>|--key-file=<path>) [--algorithm=<alg>]\n";
    std::cerr << "  verify <plugin dir>\n";
    std::cerr << "  inspect <plugin dir>\n";
    std::cerr << "  keygen --signer=<id> --output=<seed file>\n";
    std::cerr << "  template validator|reporter|html\n";
    std::cerr << "  presets\n";
    std::cerr << "  engines\n";
    std::cerr << "  audit-verify <log> [--key=<hex>]\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --config=<path>   Read settings from warden.conf (default: $WARDEN_CONFIG)\n";
    std::cerr << "  --policy=<name>   Security preset: development, testing, standard, enterprise,\n";
    std::cerr << "                    strict or airgapped\n";
  }

  std::string_view DomainPrefix(warden::ErrorDomain domain) {
    switch (domain) {
    case warden::ErrorDomain::IO:
      return "I/O error";
    case warden::ErrorDomain::Security:
      return "Security error";
    case warden::ErrorDomain::Crypto:
      return "Cryptography error";
    case warden::ErrorDomain::Validation:
      return "Validation error";
    case warden::ErrorDomain::Config:
      return "Configuration error";
    case warden::ErrorDomain::Dependency:
      return "Dependency error";
    case warden::ErrorDomain::State:
      return "State error";
    case warden::ErrorDomain::Sandbox:
      return "Sandbox error";
    case warden::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  std::string DescribeError(const warden::Error& err) {
    std::string out(err.what());
    for (const auto& entry : err.context) {
      out.append("\n  while ");
      out.append(entry);
    }
    return out;
  }

  void ReportError(const warden::Error& err, warden::orchestrator::EventBus* bus) {
    const std::string detail = DescribeError(err);
    std::cerr << DomainPrefix(err.domain) << ": " << detail << '\n';
    if (!bus) {
      return;
    }

    warden::orchestrator::Event event;
    event.category = warden::orchestrator::EventCategory::kDiagnostics;
    event.severity = warden::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = detail;
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code), warden::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                warden::orchestrator::FieldPrivacy::kHash, true);
    }
    warden::orchestrator::PublishSafely(*bus, event);
  }

  int ExitCodeFor(const warden::Error& err) {
    switch (err.domain) {
    case warden::ErrorDomain::IO:
      return kExitIO;
    case warden::ErrorDomain::Security:
    case warden::ErrorDomain::Crypto:
      return kExitAuth;
    case warden::ErrorDomain::Validation:
    case warden::ErrorDomain::Config:
      return kExitUsage;
    case warden::ErrorDomain::Dependency:
    case warden::ErrorDomain::State:
    case warden::ErrorDomain::Sandbox:
    case warden::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  bool ValidateNoEmbeddedNull(std::string_view value, std::string_view description) {
    if (value.find('\0') != std::string_view::npos) {
      std::cerr << "Validation error: " << description << " contains embedded NUL byte." << std::endl;
      return false;
    }
    return true;
  }

  bool TryParsePathArgument(std::string_view raw, std::filesystem::path& out, std::string_view description) {
    if (!ValidateNoEmbeddedNull(raw, description)) {
      return false;
    }
    if (raw.empty()) {
      std::cerr << "Validation error: " << description << " is required." << std::endl;
      return false;
    }
    out = std::filesystem::path(std::string(raw));
    return true;
  }

  // Positional arguments plus --name=value / --flag options of one command.
  struct CommandArgs {
    std::vector<std::string> positional;
    std::map<std::string, std::string, std::less<>> options;

    std::optional<std::string> Option(std::string_view name) const {
      auto it = options.find(name);
      if (it == options.end()) {
        return std::nullopt;
      }
      return it->second;
    }
    bool Flag(std::string_view name) const { return options.find(name) != options.end(); }
  };

  bool ParseCommandArgs(int argc, char** argv, int index, std::initializer_list<std::string_view> allowed,
                        CommandArgs& out) {
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        out.positional.emplace_back(arg);
        continue;
      }
      auto body = arg.substr(2);
      auto equals = body.find('=');
      auto name = body.substr(0, equals);
      if (std::find(allowed.begin(), allowed.end(), name) == allowed.end()) {
        std::cerr << "Validation error: unknown option --" << name << std::endl;
        return false;
      }
      std::string value = equals == std::string_view::npos ? std::string() : std::string(body.substr(equals + 1));
      if (!ValidateNoEmbeddedNull(value, name)) {
        return false;
      }
      out.options[std::string(name)] = std::move(value);
    }
    return true;
  }

  nlohmann::json ParseJsonArgument(std::string_view text, std::string_view description) {
    try {
      return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& err) {
      throw warden::Error(warden::ErrorDomain::Validation, warden::errors::validation::kInvalidArgument,
                          "Invalid JSON in " + std::string(description) + ": " + err.what());
    }
  }

  nlohmann::json ReadJsonFile(const std::filesystem::path& path) {
    return ParseJsonArgument(warden::orchestrator::ReadTextFile(path), path.string());
  }

  std::vector<uint8_t> DecodeKeyHex(std::string_view text, std::string_view description) {
    auto decoded = warden::crypto::HexDecode(warden::Trim(text));
    if (!decoded || decoded->empty()) {
      throw warden::Error(warden::ErrorDomain::Validation, warden::errors::validation::kInvalidArgument,
                          std::string(description) + " must be hex");
    }
    return std::move(*decoded);
  }

  void PrintJson(const nlohmann::json& value) { std::cout << value.dump(2) << std::endl; }

  // Context is built on first use so that commands without a sandbox never
  // start an interpreter.
  struct CliState {
    warden::orchestrator::WardenConfig config;
    std::unique_ptr<warden::orchestrator::Context> context;

    warden::orchestrator::Context& EnsureContext() {
      if (!context) {
        context = std::make_unique<warden::orchestrator::Context>(config);
      }
      return *context;
    }
    warden::orchestrator::EventBus* bus() { return context ? &context->bus() : nullptr; }
  };

  int HandleAnalyze(const std::filesystem::path& file, CliState& state) {
    const auto code = warden::orchestrator::ReadTextFile(file);
    auto policy = state.config.ResolvePolicy();
    warden::analysis::CodeAnalyzer analyzer(policy.blocked_modules);
    auto result = analyzer.Analyze(code);
    PrintJson(result.ToJson());
    return result.is_safe ? kExitOk : kExitSandboxFailure;
  }

  int HandleRun(const std::filesystem::path& file, const CommandArgs& args, CliState& state) {
    auto& ctx = state.EnsureContext();
    warden::sandbox::ExecutionRequest request;
    request.code = warden::orchestrator::ReadTextFile(file);
    if (auto entry = args.Option("entry"); entry && !entry->empty()) {
      request.entry_point = *entry;
    }
    if (auto entry_args = args.Option("args")) {
      request.entry_args = ParseJsonArgument(*entry_args, "--args");
    }
    if (auto globals = args.Option("globals")) {
      request.globals = ParseJsonArgument(*globals, "--globals");
    }

    warden::sandbox::SandboxResult result;
    if (auto isolation = args.Option("isolation")) {
      auto level = warden::sandbox::ParseIsolation(*isolation);
      if (!level) {
        std::cerr << "Validation error: --isolation must be none, process or container." << std::endl;
        return kExitUsage;
      }
      auto config = ctx.sandbox_config();
      config.isolation = *level;
      auto engine = ctx.CreateEngine(config);
      result = engine->Execute(request);
    } else {
      result = ctx.engine().Execute(request);
    }
    PrintJson(result.ToJson());
    return result.success ? kExitOk : kExitSandboxFailure;
  }

  int HandleValidate(const std::filesystem::path& file, const std::filesystem::path& data_file,
                     const CommandArgs& args, CliState& state) {
    const auto code = warden::orchestrator::ReadTextFile(file);
    auto data = ReadJsonFile(data_file);
    if (data.is_array()) {
      data = nlohmann::json{{"values", data}};
    }
    if (!data.is_object()) {
      std::cerr << "Validation error: data file must hold an array of values or an object." << std::endl;
      return kExitUsage;
    }
    auto params = data.value("params", nlohmann::json::object());
    if (auto override_params = args.Option("params")) {
      auto parsed = ParseJsonArgument(*override_params, "--params");
      if (!parsed.is_object()) {
        std::cerr << "Validation error: --params must be a JSON object." << std::endl;
        return kExitUsage;
      }
      params.update(parsed);
    }

    auto& ctx = state.EnsureContext();
    if (args.Flag("dry-run")) {
      auto outcome = ctx.validators().TestValidator(code, data, params);
      PrintJson(outcome);
      return outcome.value("success", false) && outcome.value("passed", nlohmann::json()) == true
                 ? kExitOk
                 : kExitSandboxFailure;
    }

    warden::drivers::ValidatorContext context;
    context.column_name = data.value("column_name", std::string("column"));
    context.values = data.value("values", nlohmann::json::array());
    context.schema = data.value("schema", nlohmann::json::object());
    context.parameters = params;
    context.row_count =
        data.value("row_count", context.values.is_array() ? static_cast<int64_t>(context.values.size()) : 0);

    warden::drivers::ValidatorDefinition validator;
    validator.validator_id = file.stem().string();
    validator.code = code;
    auto result = ctx.validators().Execute(validator, context, data_file.string());

    nlohmann::json out = {{"result", result.ToJson()}};
    if (auto log = ctx.execution_logs().Get(result.execution_id)) {
      out["execution_log"] = log->ToJson();
    }
    PrintJson(out);
    return result.failure == warden::sandbox::FailureKind::kNone && result.passed ? kExitOk : kExitSandboxFailure;
  }

  int HandleReport(const std::filesystem::path& file, const CommandArgs& args, CliState& state) {
    const auto source = warden::orchestrator::ReadTextFile(file);
    const bool is_template = args.Flag("template");
    nlohmann::json data;
    if (auto data_file = args.Option("data")) {
      std::filesystem::path data_path;
      if (!TryParsePathArgument(*data_file, data_path, "data file")) {
        return kExitUsage;
      }
      data = ReadJsonFile(data_path);
    }
    nlohmann::json settings = nlohmann::json::object();
    if (auto raw = args.Option("settings")) {
      settings = ParseJsonArgument(*raw, "--settings");
    }
    const std::string format = args.Option("format").value_or("html");

    auto& ctx = state.EnsureContext();
    warden::drivers::ReportResult result;
    if (args.Flag("preview")) {
      std::optional<std::string_view> template_text;
      std::optional<std::string_view> code;
      if (is_template) {
        template_text = source;
      } else {
        code = source;
      }
      result = ctx.reporters().PreviewReport(template_text, code, data, settings, format);
    } else {
      warden::drivers::ReporterDefinition reporter;
      reporter.reporter_id = file.stem().string();
      reporter.renderer = is_template ? warden::drivers::MakeRenderer(source, {})
                                      : warden::drivers::MakeRenderer({}, source);
      warden::drivers::ReportContext context;
      context.data = data.is_object() ? data : nlohmann::json::object();
      context.config = settings.is_object() ? settings : nlohmann::json::object();
      context.format = format;
      context.metadata = {{"generated_at", warden::FormatUtcTimestamp(std::chrono::system_clock::now())}};
      result = ctx.reporters().Execute(reporter, context);
    }

    if (!result.success) {
      std::cerr << "Report failed: " << result.error << std::endl;
      return kExitSandboxFailure;
    }
    if (auto output = args.Option("output")) {
      std::filesystem::path output_path;
      if (!TryParsePathArgument(*output, output_path, "output path")) {
        return kExitUsage;
      }
      warden::orchestrator::AtomicReplace(output_path, result.content);
      auto summary = result.ToJson();
      summary.erase("content");
      summary["written_to"] = output_path.string();
      PrintJson(summary);
    } else {
      std::cout << result.content;
      if (!result.content.empty() && result.content.back() != '\n') {
        std::cout << '\n';
      }
      std::cout.flush();
    }
    return kExitOk;
  }

  int HandleSign(const std::filesystem::path& file, const CommandArgs& args) {
    auto signer = args.Option("signer");
    if (!signer || signer->empty()) {
      std::cerr << "Validation error: --signer is required." << std::endl;
      return kExitUsage;
    }
    auto algorithm = warden::trust::ParseAlgorithm(args.Option("algorithm").value_or("ed25519"));
    if (!algorithm) {
      std::cerr << "Validation error: unknown signature algorithm." << std::endl;
      return kExitUsage;
    }

    std::vector<uint8_t> key;
    if (auto key_file = args.Option("key-file")) {
      std::filesystem::path key_path;
      if (!TryParsePathArgument(*key_file, key_path, "key file")) {
        return kExitUsage;
      }
      key = DecodeKeyHex(warden::orchestrator::ReadTextFile(key_path), "key file");
    } else if (auto key_hex = args.Option("key")) {
      key = DecodeKeyHex(*key_hex, "--key");
    } else if (!warden::trust::IsIntegrityOnly(*algorithm)) {
      std::cerr << "Validation error: --key or --key-file is required for this algorithm." << std::endl;
      return kExitUsage;
    }

    auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();
    const auto payload = warden::orchestrator::ReadTextFile(file);
    auto signature = warden::trust::Sign(*crypto, *algorithm, warden::crypto::AsBytes(payload), key, *signer);
    std::cout << "signature=" << warden::trust::AlgorithmToString(signature.algorithm) << ':'
              << signature.signer_id << ':' << signature.signature << ':' << signature.timestamp << std::endl;
    return kExitOk;
  }

  struct PluginVerification {
    warden::drivers::PluginManifest manifest;
    warden::trust::VerificationResult verification;
  };

  PluginVerification VerifyPlugin(const std::filesystem::path& directory, warden::orchestrator::Context& ctx) {
    PluginVerification out;
    out.manifest = warden::drivers::LoadPluginDirectory(directory);
    auto chain = ctx.CreateVerificationChain(!out.manifest.code.empty());
    out.verification =
        chain.Verify(warden::crypto::AsBytes(out.manifest.SignedPayload()), out.manifest.signatures);
    return out;
  }

  int HandleVerify(const std::filesystem::path& directory, CliState& state) {
    auto& ctx = state.EnsureContext();
    auto checked = VerifyPlugin(directory, ctx);
    PrintJson({{"plugin", checked.manifest.ToJson()}, {"verification", checked.verification.ToJson()}});
    return checked.verification.is_valid ? kExitOk : kExitAuth;
  }

  int HandleInspect(const std::filesystem::path& directory, CliState& state) {
    auto& ctx = state.EnsureContext();
    auto checked = VerifyPlugin(directory, ctx);
    const auto valid_signatures =
        checked.verification.metadata.value("valid_signatures", static_cast<uint32_t>(0));

    auto analyzer = ctx.CreateSecurityAnalyzer();
    std::optional<std::string_view> code;
    if (!checked.manifest.code.empty()) {
      code = checked.manifest.code;
    }
    auto report = analyzer.AnalyzePlugin(checked.manifest.id, code, checked.verification.is_valid,
                                         checked.verification.is_valid ? valid_signatures : 0);
    auto violations = analyzer.Validate(report);

    PrintJson({
        {"plugin", checked.manifest.ToJson()},
        {"policy", ctx.policy().name},
        {"verification", checked.verification.ToJson()},
        {"security_report", report.ToJson()},
        {"policy_violations", violations},
    });
    return violations.empty() ? kExitOk : kExitAuth;
  }

  int HandleKeygen(const CommandArgs& args) {
    auto signer = args.Option("signer");
    auto output = args.Option("output");
    if (!signer || signer->empty() || !output) {
      std::cerr << "Validation error: --signer and --output are required." << std::endl;
      return kExitUsage;
    }
    std::filesystem::path output_path;
    if (!TryParsePathArgument(*output, output_path, "output path")) {
      return kExitUsage;
    }

    auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();
    std::array<uint8_t, warden::crypto::kEd25519KeySize> seed{};
    crypto->RandomBytes(seed);
    auto public_key = crypto->Ed25519PublicKey(seed);
    warden::orchestrator::AtomicReplace(output_path, warden::crypto::HexEncode(seed) + "\n");
    std::fill(seed.begin(), seed.end(), uint8_t{0});

    std::cout << "# Add to the trust file:" << std::endl;
    std::cout << "signer:" << *signer << "=ed25519:" << warden::crypto::HexEncode(public_key) << std::endl;
    return kExitOk;
  }

  int HandleTemplate(std::string_view kind) {
    if (kind == "validator") {
      std::cout << warden::drivers::ValidatorTemplate();
    } else if (kind == "reporter") {
      std::cout << warden::drivers::ReporterTemplate();
    } else if (kind == "html") {
      std::cout << warden::drivers::ReportHtmlTemplate();
    } else {
      PrintUsage();
      return kExitUsage;
    }
    std::cout.flush();
    return kExitOk;
  }

  int HandlePresets() {
    auto out = nlohmann::json::array();
    for (const auto& preset : warden::trust::ListPresets()) {
      out.push_back({
          {"name", preset.name},
          {"description", preset.description},
          {"isolation_level", warden::sandbox::IsolationToString(preset.isolation)},
          {"require_signature", preset.require_signature},
          {"min_signatures", preset.min_signatures},
      });
    }
    PrintJson(out);
    return kExitOk;
  }

  int HandleEngines(CliState& state) {
    auto policy = state.config.ResolvePolicy();
    auto config = state.config.ResolveSandboxConfig(policy);
    auto out = nlohmann::json::array();
    for (const auto& engine : warden::sandbox::AvailableEngines(config)) {
      out.push_back({
          {"isolation_level", warden::sandbox::IsolationToString(engine.isolation)},
          {"available", engine.available},
          {"runtime", engine.runtime},
          {"detail", engine.detail},
          {"selected", engine.isolation == config.isolation},
      });
    }
    PrintJson(out);
    return kExitOk;
  }

  int HandleAuditVerify(const std::filesystem::path& log, const CommandArgs& args, CliState& state) {
    std::vector<uint8_t> key;
    if (auto key_hex = args.Option("key")) {
      key = DecodeKeyHex(*key_hex, "--key");
    } else if (!state.config.audit_key.empty()) {
      key = state.config.audit_key;
    } else {
      std::cerr << "Validation error: --key is required when no audit_key is configured." << std::endl;
      return kExitUsage;
    }
    auto crypto = warden::crypto::MakeOpenSSLCryptoProvider();
    auto result = warden::orchestrator::VerifyAuditLog(log, key, *crypto);
    PrintJson({
        {"ok", result.ok},
        {"entries", result.entries},
        {"failed_line", result.failed_line},
        {"error", result.error},
    });
    return result.ok ? kExitOk : kExitAuth;
  }

} // namespace

int main(int argc, char** argv) {
  CliState state;
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    int index = 1;
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> policy_override;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--help") {
        PrintUsage();
        return kExitOk;
      }
      if (arg.rfind("--config=", 0) == 0) {
        std::filesystem::path parsed;
        if (!TryParsePathArgument(arg.substr(std::string_view("--config=").size()), parsed, "config path")) {
          return kExitUsage;
        }
        config_path = std::move(parsed);
        continue;
      }
      if (arg.rfind("--policy=", 0) == 0) {
        auto value = arg.substr(std::string_view("--policy=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        policy_override = std::string(value);
        continue;
      }

      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    state.config = warden::orchestrator::LoadConfigFromEnvironment(config_path);
    if (policy_override) {
      (void)warden::trust::GetPreset(*policy_override);
      state.config.policy = *policy_override;
    }

    std::string cmd = argv[index++];
    CommandArgs args;

    if (cmd == "analyze") {
      if (!ParseCommandArgs(argc, argv, index, {}, args) || args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path file;
      if (!TryParsePathArgument(args.positional[0], file, "code file")) {
        return kExitUsage;
      }
      return HandleAnalyze(file, state);
    }
    if (cmd == "run") {
      if (!ParseCommandArgs(argc, argv, index, {"entry", "args", "globals", "isolation"}, args) ||
          args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path file;
      if (!TryParsePathArgument(args.positional[0], file, "code file")) {
        return kExitUsage;
      }
      return HandleRun(file, args, state);
    }
    if (cmd == "validate") {
      if (!ParseCommandArgs(argc, argv, index, {"params", "dry-run"}, args) || args.positional.size() != 2) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path file;
      std::filesystem::path data_file;
      if (!TryParsePathArgument(args.positional[0], file, "validator file") ||
          !TryParsePathArgument(args.positional[1], data_file, "data file")) {
        return kExitUsage;
      }
      return HandleValidate(file, data_file, args, state);
    }
    if (cmd == "report") {
      if (!ParseCommandArgs(argc, argv, index, {"template", "data", "format", "settings", "output", "preview"},
                            args) ||
          args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path file;
      if (!TryParsePathArgument(args.positional[0], file, "reporter file")) {
        return kExitUsage;
      }
      return HandleReport(file, args, state);
    }
    if (cmd == "sign") {
      if (!ParseCommandArgs(argc, argv, index, {"signer", "key", "key-file", "algorithm"}, args) ||
          args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path file;
      if (!TryParsePathArgument(args.positional[0], file, "file to sign")) {
        return kExitUsage;
      }
      return HandleSign(file, args);
    }
    if (cmd == "verify" || cmd == "inspect") {
      if (!ParseCommandArgs(argc, argv, index, {}, args) || args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path directory;
      if (!TryParsePathArgument(args.positional[0], directory, "plugin directory")) {
        return kExitUsage;
      }
      return cmd == "verify" ? HandleVerify(directory, state) : HandleInspect(directory, state);
    }
    if (cmd == "keygen") {
      if (!ParseCommandArgs(argc, argv, index, {"signer", "output"}, args) || !args.positional.empty()) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleKeygen(args);
    }
    if (cmd == "template") {
      if (argc - index != 1) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleTemplate(argv[index]);
    }
    if (cmd == "presets") {
      if (argc != index) {
        PrintUsage();
        return kExitUsage;
      }
      return HandlePresets();
    }
    if (cmd == "engines") {
      if (argc != index) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleEngines(state);
    }
    if (cmd == "audit-verify") {
      if (!ParseCommandArgs(argc, argv, index, {"key"}, args) || args.positional.size() != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::filesystem::path log;
      if (!TryParsePathArgument(args.positional[0], log, "audit log")) {
        return kExitUsage;
      }
      return HandleAuditVerify(log, args, state);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const warden::Error& err) {
    ReportError(err, state.bus());
    return ExitCodeFor(err);
  } catch (const std::exception& ex) {
    std::cerr << "Internal error: " << ex.what() << std::endl;
    return kExitIO;
  }
}
