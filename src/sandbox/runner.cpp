#include "warden/sandbox/runner.h"

#include <algorithm>

#include "warden/analysis/analyzer.h"
#include "warden/errors.h"

namespace warden::sandbox {
namespace {

constexpr std::string_view kRunnerScript = R"WARDEN_PY(import ast as _ast
import builtins as _builtins
import io as _io
import json as _json
import os as _os
import sys as _sys
import traceback as _traceback
import types as _types

_MARK = "__WARDEN_RESULT_"
_ESCAPED = "__WARDEN_RESULT\\_"
_SAFE_EXCEPTIONS = (
    "Exception", "ValueError", "TypeError", "KeyError", "IndexError",
    "AttributeError", "RuntimeError", "StopIteration", "ImportError",
    "ZeroDivisionError", "ArithmeticError", "LookupError",
    "NotImplementedError", "AssertionError",
)


class _ImportDenied(ImportError):
    pass


class _AttributeDenied(Exception):
    pass


def _is_private(name):
    if not name.startswith("_"):
        return False
    return not (len(name) > 4 and name.startswith("__") and name.endswith("__"))


class _ModuleView(object):
    """Read-only view of an allowed module exposing only its public names."""

    __slots__ = ("_view_module",)

    def __init__(self, module):
        object.__setattr__(self, "_view_module", module)

    def __getattribute__(self, name):
        if name.startswith("_") and name not in ("__name__", "__doc__"):
            raise AttributeError("Access to '%s' is not allowed" % name)
        value = getattr(object.__getattribute__(self, "_view_module"), name)
        if isinstance(value, _types.ModuleType):
            return _ModuleView(value)
        return value

    def __setattr__(self, name, value):
        raise AttributeError("Sandboxed modules are read-only")

    def __delattr__(self, name):
        raise AttributeError("Sandboxed modules are read-only")

    def __dir__(self):
        module = object.__getattribute__(self, "_view_module")
        return [n for n in dir(module) if not n.startswith("_")]

    def __repr__(self):
        return "<module %r>" % object.__getattribute__(self, "_view_module").__name__


def _check_attributes(tree, blocked):
    for node in _ast.walk(tree):
        if isinstance(node, _ast.Attribute) and (node.attr in blocked or _is_private(node.attr)):
            raise _AttributeDenied("Access to attribute '%s' is not allowed" % node.attr)


class _EscapingWriter(_io.TextIOBase):
    """Forwards user output, neutralising result delimiters and capping size."""

    def __init__(self, target, limit):
        self._target = target
        self._limit = limit
        self._written = 0
        self._pending = ""
        self.truncated = False

    def writable(self):
        return True

    def _emit(self, text):
        if not text or self.truncated:
            return
        room = self._limit - self._written
        if len(text) > room:
            text = text[:max(room, 0)]
            self.truncated = True
        self._written += len(text)
        self._target.write(text)

    def write(self, s):
        s = str(s)
        data = self._pending + s
        keep = 0
        for k in range(min(len(_MARK) - 1, len(data)), 0, -1):
            if _MARK.startswith(data[-k:]):
                keep = k
                break
        if keep:
            out, self._pending = data[:-keep], data[-keep:]
        else:
            out, self._pending = data, ""
        self._emit(out.replace(_MARK, _ESCAPED))
        return len(s)

    def flush(self):
        if self._pending:
            self._emit(self._pending)
            self._pending = ""
        self._target.flush()


def _parse_args(argv):
    result_fd = None
    request_path = None
    i = 1
    while i < len(argv):
        if argv[i] == "--result-fd" and i + 1 < len(argv):
            result_fd = int(argv[i + 1])
            i += 2
            continue
        request_path = argv[i]
        i += 1
    return result_fd, request_path


def _load_request(path):
    if path:
        with open(path, "r", encoding="utf-8") as handle:
            return _json.load(handle)
    return _json.loads(_sys.stdin.read())


def _gatekeeper(allowed, blocked, state):
    real_import = _builtins.__import__

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level != 0:
            state["denied"] = name or "."
            raise _ImportDenied("Relative imports are not allowed")
        base = name.split(".")[0]
        if base in blocked or base not in allowed:
            state["denied"] = name
            raise _ImportDenied("Import of '%s' is not allowed" % name)
        return _ModuleView(real_import(name, globals, locals, fromlist, level))

    return guarded_import


def _restricted_builtins(request, state):
    safe = {}
    for name in request.get("allowed_builtins") or []:
        if hasattr(_builtins, name):
            safe[name] = getattr(_builtins, name)
    for name in _SAFE_EXCEPTIONS:
        safe[name] = getattr(_builtins, name)
    safe["__build_class__"] = _builtins.__build_class__
    safe["__import__"] = _gatekeeper(
        frozenset(request.get("allowed_modules") or []),
        frozenset(request.get("blocked_modules") or []),
        state,
    )
    return safe


def _encode(value):
    try:
        _json.dumps(value, allow_nan=False)
        return value
    except (TypeError, ValueError, OverflowError, RecursionError):
        return str(value)


def _execute(request, state):
    namespace = {}
    namespace.update(request.get("globals") or {})
    namespace.update(request.get("locals") or {})
    namespace["__builtins__"] = _restricted_builtins(request, state)
    namespace["__name__"] = "__sandbox__"

    tree = _ast.parse(request.get("code") or "", "<plugin>", "exec")
    _check_attributes(tree, frozenset(request.get("blocked_attributes") or []))
    code = compile(tree, "<plugin>", "exec")
    exec(code, namespace)

    entry_point = request.get("entry_point")
    if not entry_point:
        return {"success": True, "result": namespace.get("result")}
    if entry_point not in namespace:
        return {"success": False, "error": "Entry point '%s' not found" % entry_point,
                "error_type": "KeyError"}
    func = namespace[entry_point]
    if not callable(func):
        return {"success": False, "error": "Entry point '%s' is not callable" % entry_point,
                "error_type": "ValueError"}
    args = request.get("entry_args")
    if isinstance(args, dict):
        value = func(**args)
    elif isinstance(args, list):
        value = func(*args)
    elif args is None:
        value = func()
    else:
        value = func(args)
    return {"success": True, "result": value}


def main():
    result_fd, request_path = _parse_args(_sys.argv)
    request = _load_request(request_path)
    nonce = str(request.get("nonce") or "")
    limit = int(request.get("max_output") or 1048576)
    _sys.stdin = _io.StringIO("")

    real_stdout = _sys.stdout
    writer = _EscapingWriter(real_stdout, limit)
    _sys.stdout = writer
    state = {}
    try:
        outcome = _execute(request, state)
    except _ImportDenied as exc:
        outcome = {"success": False, "error": "ImportError: %s" % exc,
                   "error_type": "ImportError", "violation": True}
    except _AttributeDenied as exc:
        outcome = {"success": False, "error": "AttributeError: %s" % exc,
                   "error_type": "AttributeError", "violation": True}
    except MemoryError:
        outcome = {"success": False, "error": "MemoryError: memory limit exceeded",
                   "error_type": "MemoryError"}
    except SyntaxError as exc:
        outcome = {"success": False, "error": "SyntaxError: %s" % exc, "error_type": "SyntaxError"}
    except (Exception, SystemExit) as exc:
        _traceback.print_exc(limit=8, file=_sys.stderr)
        outcome = {"success": False, "error": "%s: %s" % (type(exc).__name__, exc),
                   "error_type": type(exc).__name__}
    finally:
        try:
            writer.flush()
        except (OSError, ValueError):
            pass
        _sys.stdout = real_stdout

    if outcome.get("success"):
        outcome["result"] = _encode(outcome.get("result"))
    else:
        outcome.setdefault("result", None)
    if writer.truncated:
        outcome["stdout_truncated"] = True
    try:
        payload = _json.dumps(outcome, allow_nan=False)
    except (TypeError, ValueError):
        payload = _json.dumps({"success": False, "result": None,
                               "error": "Result could not be serialized",
                               "error_type": "SerializationError"})
    block = "%s%s_BEGIN__\n%s\n%s%s_END__\n" % (_MARK, nonce, payload, _MARK, nonce)
    data = block.encode("utf-8")
    if result_fd is not None:
        view = memoryview(data)
        while view:
            written = _os.write(result_fd, view)
            view = view[written:]
        _os.close(result_fd)
    else:
        real_stdout.flush()
        _sys.stdout.write(block)
        _sys.stdout.flush()


if __name__ == "__main__":
    main()
)WARDEN_PY";

nlohmann::json ObjectOrEmpty(const nlohmann::json& value) {
  if (value.is_object()) {
    return value;
  }
  return nlohmann::json::object();
}

}  // namespace

std::string_view RunnerScript() { return kRunnerScript; }

nlohmann::json BuildRunnerRequest(const SandboxConfig& config, const ExecutionRequest& request,
                                  std::string_view nonce) {
  nlohmann::json payload = {
      {"code", request.code},
      {"globals", ObjectOrEmpty(request.globals)},
      {"locals", ObjectOrEmpty(request.locals)},
      {"entry_point", request.entry_point ? nlohmann::json(*request.entry_point) : nlohmann::json()},
      {"entry_args", request.entry_args},
      {"allowed_builtins", config.allowed_builtins},
      {"allowed_modules", config.EffectiveAllowedModules()},
      {"blocked_modules", config.blocked_modules},
      {"blocked_attributes", analysis::BlockedAttributes()},
      {"nonce", std::string(nonce)},
      {"max_output", config.max_output_bytes},
  };
  return payload;
}

std::string BeginDelimiter(std::string_view nonce) {
  std::string out(kResultMarker);
  out.append(nonce);
  out.append("_BEGIN__");
  return out;
}

std::string EndDelimiter(std::string_view nonce) {
  std::string out(kResultMarker);
  out.append(nonce);
  out.append("_END__");
  return out;
}

ExtractedBlock ExtractResultBlock(std::string_view text, std::string_view nonce) {
  ExtractedBlock block;
  const auto begin = BeginDelimiter(nonce);
  const auto end = EndDelimiter(nonce);
  auto begin_pos = text.find(begin);
  if (begin_pos == std::string_view::npos) {
    block.remainder = std::string(text);
    return block;
  }
  auto body_start = begin_pos + begin.size();
  auto end_pos = text.find(end, body_start);
  block.status = BlockStatus::kMalformed;
  if (end_pos == std::string_view::npos) {
    block.error = "result block is not terminated";
    block.remainder = std::string(text.substr(0, begin_pos));
    return block;
  }
  if (text.find(begin, end_pos) != std::string_view::npos) {
    block.error = "more than one result block";
    block.remainder = std::string(text);
    return block;
  }
  auto tail_start = end_pos + end.size();
  if (tail_start < text.size() && text[tail_start] == '\n') {
    ++tail_start;
  }
  block.remainder = std::string(text.substr(0, begin_pos));
  block.remainder.append(text.substr(tail_start));

  auto body = text.substr(body_start, end_pos - body_start);
  try {
    block.payload = nlohmann::json::parse(body.begin(), body.end());
  } catch (const nlohmann::json::exception& ex) {
    block.error = std::string("result block is not valid JSON: ") + ex.what();
    return block;
  }
  if (!block.payload.is_object() || !block.payload.contains("success") ||
      !block.payload["success"].is_boolean()) {
    block.error = "result block lacks a boolean 'success' field";
    return block;
  }
  block.status = BlockStatus::kFound;
  return block;
}

void ApplyRunnerPayload(const nlohmann::json& payload, SandboxResult& out) {
  out.success = payload.value("success", false);
  out.result = payload.contains("result") ? payload["result"] : nlohmann::json();
  if (out.success) {
    out.failure = FailureKind::kNone;
    out.error.clear();
    out.error_type.clear();
    return;
  }
  auto text_field = [&payload](const char* key) -> std::string {
    if (payload.contains(key) && payload[key].is_string()) {
      return payload[key].get<std::string>();
    }
    return {};
  };
  out.error = text_field("error");
  out.error_type = text_field("error_type");
  const bool violation = payload.contains("violation") && payload["violation"].is_boolean() &&
                         payload["violation"].get<bool>();
  if (violation) {
    out.failure = FailureKind::kSecurityViolation;
  } else if (out.error_type == "MemoryError") {
    out.failure = FailureKind::kResourceExceeded;
  } else if (out.error_type == "SyntaxError") {
    out.failure = FailureKind::kParseFailure;
  } else {
    out.failure = FailureKind::kExecutionFailure;
  }
  EnsureFailureDetails(out);
}

void TruncateOutput(std::string& text, size_t limit, bool already_truncated) {
  if (text.size() > limit) {
    text.resize(limit);
    already_truncated = true;
  }
  if (already_truncated) {
    text.append(errors::msg::kTruncatedSuffix);
  }
}

void EnsureFailureDetails(SandboxResult& result) {
  if (result.success) {
    return;
  }
  if (result.failure == FailureKind::kNone) {
    result.failure = FailureKind::kExecutionFailure;
  }
  if (result.error_type.empty()) {
    result.error_type = "ExecutionError";
  }
  if (result.error.empty()) {
    result.error = std::string(errors::msg::kExecutionFailed);
  }
}

}  // namespace warden::sandbox
