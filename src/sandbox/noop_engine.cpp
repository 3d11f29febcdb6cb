#include "warden/sandbox/noop_engine.h"

#include <chrono>
#include <optional>

#include <pybind11/embed.h>

#include "warden/error.h"
#include "warden/sandbox/runner.h"

namespace py = pybind11;

namespace warden::sandbox {

struct EmbeddedPython::State {
  // Declaration order matters: the GIL is re-acquired before the interpreter finalizes.
  std::optional<py::scoped_interpreter> interpreter;
  std::optional<py::gil_scoped_release> release;
};

EmbeddedPython::EmbeddedPython() : state_(std::make_unique<State>()) {
  if (!Py_IsInitialized()) {
    try {
      state_->interpreter.emplace();
    } catch (const std::exception& ex) {
      throw Error(ErrorDomain::Sandbox, errors::sandbox::kEmbeddedRuntimeFailed,
                  std::string("Failed to start embedded interpreter: ") + ex.what());
    }
    state_->release.emplace();
  }
}

EmbeddedPython::~EmbeddedPython() = default;

bool EmbeddedPython::owns_interpreter() const noexcept { return state_->interpreter.has_value(); }

namespace {

// Swaps sys.stdout/sys.stderr for StringIO buffers and restores them on exit.
class CapturedStreams {
public:
  CapturedStreams() {
    sys_ = py::module_::import("sys");
    auto io = py::module_::import("io");
    saved_stdout_ = sys_.attr("stdout");
    saved_stderr_ = sys_.attr("stderr");
    stdout_buffer_ = io.attr("StringIO")();
    stderr_buffer_ = io.attr("StringIO")();
    sys_.attr("stdout") = stdout_buffer_;
    sys_.attr("stderr") = stderr_buffer_;
  }

  ~CapturedStreams() {
    try {
      sys_.attr("stdout") = saved_stdout_;
      sys_.attr("stderr") = saved_stderr_;
    } catch (const py::error_already_set&) {
      PyErr_Clear();
    }
  }

  CapturedStreams(const CapturedStreams&) = delete;
  CapturedStreams& operator=(const CapturedStreams&) = delete;

  std::string Stdout() const { return stdout_buffer_.attr("getvalue")().cast<std::string>(); }
  std::string Stderr() const { return stderr_buffer_.attr("getvalue")().cast<std::string>(); }

private:
  py::module_ sys_;
  py::object saved_stdout_;
  py::object saved_stderr_;
  py::object stdout_buffer_;
  py::object stderr_buffer_;
};

py::object ToPython(const py::module_& json, const nlohmann::json& value) {
  return json.attr("loads")(value.dump());
}

nlohmann::json FromPython(const py::module_& json, const py::object& value) {
  try {
    auto text = json.attr("dumps")(value, py::arg("allow_nan") = false).cast<std::string>();
    return nlohmann::json::parse(text);
  } catch (const py::error_already_set&) {
    return py::str(value).cast<std::string>();
  }
}

SandboxResult RunInterpreter(const ExecutionRequest& request) {
  auto json = py::module_::import("json");
  auto builtins = py::module_::import("builtins");

  py::dict ns;
  if (request.globals.is_object()) {
    ns.attr("update")(ToPython(json, request.globals));
  }
  if (request.locals.is_object()) {
    ns.attr("update")(ToPython(json, request.locals));
  }
  ns["__builtins__"] = builtins;
  ns["__name__"] = "__sandbox__";

  auto compiled = builtins.attr("compile")(request.code, "<plugin>", "exec");
  builtins.attr("exec")(compiled, ns);

  SandboxResult out;
  out.success = true;
  if (!request.entry_point || request.entry_point->empty()) {
    out.result = ns.contains("result") ? FromPython(json, ns["result"]) : nlohmann::json();
    return out;
  }
  const auto& entry = *request.entry_point;
  if (!ns.contains(entry)) {
    return SandboxResult::Failure(FailureKind::kExecutionFailure, "KeyError",
                                  "Entry point '" + entry + "' not found");
  }
  py::object func = ns[entry.c_str()];
  if (!PyCallable_Check(func.ptr())) {
    return SandboxResult::Failure(FailureKind::kExecutionFailure, "ValueError",
                                  "Entry point '" + entry + "' is not callable");
  }
  py::object value;
  if (request.entry_args.is_object()) {
    py::dict kwargs = ToPython(json, request.entry_args);
    value = func(**kwargs);
  } else if (request.entry_args.is_array()) {
    py::list args = ToPython(json, request.entry_args);
    value = func(*args);
  } else if (request.entry_args.is_null()) {
    value = func();
  } else {
    value = func(ToPython(json, request.entry_args));
  }
  out.result = FromPython(json, value);
  return out;
}

SandboxResult FromPythonError(const py::error_already_set& error) {
  std::string type_name = "Exception";
  try {
    type_name = error.type().attr("__name__").cast<std::string>();
  } catch (const py::error_already_set&) {
    PyErr_Clear();
  }
  std::string detail;
  try {
    detail = py::str(error.value()).cast<std::string>();
  } catch (const py::error_already_set&) {
    PyErr_Clear();
  }
  auto kind = FailureKind::kExecutionFailure;
  if (error.matches(PyExc_MemoryError)) {
    kind = FailureKind::kResourceExceeded;
  } else if (error.matches(PyExc_SyntaxError)) {
    kind = FailureKind::kParseFailure;
  }
  return SandboxResult::Failure(kind, type_name, type_name + ": " + detail);
}

}  // namespace

NoOpEngine::NoOpEngine(SandboxConfig config, std::shared_ptr<EmbeddedPython> runtime,
                       orchestrator::EventBus* bus)
    : config_(std::move(config)), runtime_(std::move(runtime)), bus_(bus) {
  if (!runtime_) {
    throw Error(ErrorDomain::Sandbox, errors::sandbox::kEmbeddedRuntimeFailed,
                "NoOp engine requires an embedded interpreter");
  }
}

SandboxResult NoOpEngine::Execute(const ExecutionRequest& request) noexcept {
  const auto started = std::chrono::steady_clock::now();
  SandboxResult result;
  try {
    py::gil_scoped_acquire gil;
    CapturedStreams streams;
    try {
      result = RunInterpreter(request);
    } catch (const py::error_already_set& error) {
      result = FromPythonError(error);
    }
    result.stdout_text = streams.Stdout();
    result.stderr_text = streams.Stderr();
  } catch (const py::error_already_set& error) {
    result = SandboxResult::Failure(FailureKind::kExecutionFailure, "SandboxError", error.what());
  } catch (const std::exception& ex) {
    result = SandboxResult::Failure(FailureKind::kExecutionFailure, "SandboxError", ex.what());
  }
  result.execution_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  result.exit_code = result.success ? 0 : 1;
  TruncateOutput(result.stdout_text, config_.max_output_bytes, false);
  TruncateOutput(result.stderr_text, config_.max_output_bytes, false);
  EnsureFailureDetails(result);

  if (bus_ != nullptr) {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kDiagnostics;
    event.severity = orchestrator::EventSeverity::kDebug;
    event.event_id = "sandbox_execution_finished";
    event.message = "In-process execution finished";
    event.fields.emplace_back("engine", "none");
    event.fields.emplace_back("success", result.success ? "true" : "false");
    orchestrator::PublishSafely(*bus_, event);
  }
  return result;
}

}  // namespace warden::sandbox
