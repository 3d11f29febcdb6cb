#include "warden/sandbox/config.h"

#include <algorithm>

#include "warden/common.h"

namespace warden::sandbox {

const char* IsolationToString(IsolationLevel level) {
  switch (level) {
  case IsolationLevel::kNone:
    return "none";
  case IsolationLevel::kProcess:
    return "process";
  case IsolationLevel::kContainer:
    return "container";
  }
  return "process";
}

std::optional<IsolationLevel> ParseIsolation(std::string_view text) {
  text = Trim(text);
  if (text == "none") {
    return IsolationLevel::kNone;
  }
  if (text == "process") {
    return IsolationLevel::kProcess;
  }
  if (text == "container") {
    return IsolationLevel::kContainer;
  }
  return std::nullopt;
}

std::vector<std::string> DefaultAllowedModules() {
  return {"math",       "statistics", "decimal",  "fractions",   "random",    "re",
          "json",       "datetime",   "collections", "itertools", "functools", "operator",
          "string",     "textwrap",   "unicodedata", "typing",    "dataclasses", "enum",
          "copy",       "numbers",    "hashlib",  "hmac",        "base64",    "binascii",
          "csv",        "abc",        "contextlib"};
}

std::vector<std::string> DefaultBlockedModules() {
  return {"os",          "subprocess", "sys",     "shutil",   "socket", "http",
          "urllib",      "requests",   "httpx",   "multiprocessing", "threading", "ctypes",
          "pickle",      "shelve",     "sqlite3", "importlib"};
}

std::vector<std::string> DefaultAllowedBuiltins() {
  return {"abs",      "all",        "any",        "ascii",     "bin",       "bool",   "bytes",
          "callable", "chr",        "classmethod", "complex",  "dict",      "divmod", "enumerate",
          "filter",   "float",      "format",     "frozenset", "hasattr",   "hash",   "hex",
          "id",       "int",        "isinstance", "issubclass", "iter",     "len",    "list",
          "map",      "max",        "min",        "next",      "object",    "oct",    "ord",
          "pow",      "print",      "property",   "range",     "repr",      "reversed", "round",
          "set",      "slice",      "sorted",     "staticmethod", "str",    "sum",    "super",
          "tuple",    "type",       "zip"};
}

std::vector<std::string> SandboxConfig::EffectiveAllowedModules() const {
  auto modules = allowed_modules;
  if (allow_filesystem) {
    if (std::find(modules.begin(), modules.end(), "io") == modules.end()) {
      modules.emplace_back("io");
    }
  } else {
    modules.erase(std::remove(modules.begin(), modules.end(), "io"), modules.end());
  }
  return modules;
}

}  // namespace warden::sandbox
