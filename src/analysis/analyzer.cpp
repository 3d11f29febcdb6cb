#include "warden/analysis/analyzer.h"

#include <algorithm>
#include <mutex>
#include <set>

#include "warden/analysis/parser.h"
#include "warden/common.h"
#include "warden/sandbox/config.h"

namespace warden::analysis {

namespace {

struct DangerousPattern {
  std::string_view needle;
  std::string_view description;
};

constexpr DangerousPattern kDangerousPatterns[] = {
    {"os.system", "os.system call"},   {"subprocess.", "subprocess usage"},
    {"socket.", "socket usage"},       {"__import__", "dynamic import"},
    {"importlib.", "importlib usage"}, {"ctypes.", "ctypes usage"},
    {"pickle.", "pickle usage"},       {"marshal.", "marshal usage"},
};

struct PermissionGroup {
  std::string_view permission;
  std::initializer_list<std::string_view> modules;
};

const std::vector<PermissionGroup>& PermissionGroups() {
  static const std::vector<PermissionGroup> groups = {
      {"file_system", {"os", "shutil", "pathlib", "tempfile", "glob", "fnmatch"}},
      {"execute_code", {"subprocess", "multiprocessing", "concurrent", "asyncio"}},
      {"network_access", {"socket", "http", "urllib", "requests", "httpx", "aiohttp", "ssl"}},
      {"database_access", {"sqlite3", "pymysql", "psycopg", "pymongo", "redis"}},
  };
  return groups;
}

bool Contains(const std::vector<std::string>& list, std::string_view item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

class Walker {
public:
  Walker(const std::vector<std::string>& blocked_modules, AnalysisResult& out)
      : blocked_modules_(blocked_modules), out_(out) {}

  void Visit(const Node& node) {
    switch (node.kind) {
    case NodeKind::kCall:
      CheckCall(node);
      break;
    case NodeKind::kAttribute:
      if (Contains(BlockedAttributes(), node.text)) {
        out_.issues.push_back("Blocked attribute access: " + node.text);
        out_.blocked_constructs.push_back("attr:" + node.text);
      } else if (IsPrivateAttribute(node.text)) {
        out_.issues.push_back("Private attribute access: " + node.text);
        out_.blocked_constructs.push_back("attr:" + node.text);
      }
      break;
    case NodeKind::kImport:
      for (const auto& alias : node.children) {
        CheckImport(alias->text);
      }
      return;
    case NodeKind::kImportFrom:
      if (!node.text.empty()) {
        CheckImport(node.text);
      }
      return;
    case NodeKind::kFunctionDef:
    case NodeKind::kAsyncFunctionDef:
      complexity_ += 1;
      break;
    case NodeKind::kClassDef:
      complexity_ += 2;
      break;
    case NodeKind::kFor:
    case NodeKind::kAsyncFor:
      complexity_ += 1;
      VisitLoop(node);
      return;
    case NodeKind::kWhile:
      complexity_ += 2;
      VisitLoop(node);
      return;
    case NodeKind::kIf:
      complexity_ += 1;
      break;
    case NodeKind::kTry:
    case NodeKind::kTryStar:
      complexity_ += 1;
      for (const auto& child : node.children) {
        if (child->kind == NodeKind::kExceptHandler && child->flag) {
          out_.warnings.emplace_back("Bare except clause found");
        }
      }
      break;
    default:
      break;
    }
    VisitChildren(node);
  }

  std::set<std::string>& permissions() { return permissions_; }
  int complexity() const { return complexity_; }

private:
  void VisitChildren(const Node& node) {
    for (const auto& child : node.children) {
      Visit(*child);
    }
  }

  void VisitLoop(const Node& node) {
    ++loop_depth_;
    if (loop_depth_ > kMaxLoopDepth) {
      out_.warnings.emplace_back("Deeply nested loops (depth > 3)");
    }
    VisitChildren(node);
    --loop_depth_;
  }

  void CheckCall(const Node& node) {
    if (node.children.empty()) {
      return;
    }
    const Node& callee = *node.children.front();
    if (callee.kind != NodeKind::kName && callee.kind != NodeKind::kAttribute) {
      return;
    }
    if (Contains(BlockedCalls(), callee.text)) {
      out_.issues.push_back("Blocked function call: " + callee.text);
      out_.blocked_constructs.push_back("call:" + callee.text);
    }
  }

  void CheckImport(const std::string& dotted) {
    out_.detected_imports.push_back(dotted);
    const auto base = dotted.substr(0, dotted.find('.'));
    if (Contains(blocked_modules_, base)) {
      out_.issues.push_back("Blocked module import: " + base);
      out_.blocked_constructs.push_back("import:" + base);
      return;
    }
    if (auto permission = PermissionForModule(base)) {
      permissions_.insert(*permission);
      out_.warnings.push_back("Import requires permission: " + base);
    }
  }

  const std::vector<std::string>& blocked_modules_;
  AnalysisResult& out_;
  std::set<std::string> permissions_;
  int complexity_{0};
  int loop_depth_{0};
};

}  // namespace

nlohmann::json AnalysisResult::ToJson() const {
  return {
      {"is_safe", is_safe},
      {"issues", issues},
      {"warnings", warnings},
      {"blocked_constructs", blocked_constructs},
      {"detected_imports", detected_imports},
      {"detected_permissions", detected_permissions},
      {"complexity_score", complexity_score},
  };
}

const std::vector<std::string>& BlockedCalls() {
  static const std::vector<std::string> calls = {
      "eval",    "exec",    "compile", "open",    "input",      "__import__",
      "globals", "locals",  "vars",    "dir",     "getattr",    "setattr",
      "delattr", "breakpoint", "exit", "quit",    "memoryview", "bytearray"};
  return calls;
}

const std::vector<std::string>& BlockedAttributes() {
  static const std::vector<std::string> attributes = {
      "__class__",   "__bases__",   "__subclasses__", "__mro__",      "__code__",
      "__globals__", "__builtins__", "__dict__",      "__closure__",  "__func__",
      "__self__",    "__module__",  "__qualname__",   "__annotations__", "__slots__",
      "__reduce__",  "__reduce_ex__", "__getstate__", "__setstate__"};
  return attributes;
}

bool IsPrivateAttribute(std::string_view name) {
  if (name.empty() || name.front() != '_') {
    return false;
  }
  const bool dunder = name.size() > 4 && name.starts_with("__") && name.ends_with("__");
  return !dunder;
}

std::optional<std::string> PermissionForModule(std::string_view module) {
  for (const auto& group : PermissionGroups()) {
    for (auto candidate : group.modules) {
      if (candidate == module) {
        return std::string(group.permission);
      }
    }
  }
  return std::nullopt;
}

CodeAnalyzer::CodeAnalyzer(std::vector<std::string> extra_blocked_modules)
    : blocked_modules_(sandbox::DefaultBlockedModules()) {
  for (auto& module : extra_blocked_modules) {
    if (!Contains(blocked_modules_, module)) {
      blocked_modules_.push_back(std::move(module));
    }
  }
}

AnalysisResult CodeAnalyzer::Analyze(std::string_view code) const {
  AnalysisResult out;
  ParsedModule parsed;
  try {
    parsed = ParseModule(code);
  } catch (const SyntaxError& ex) {
    out.is_safe = false;
    out.issues.push_back("Syntax error: " + std::string(ex.what()) + " (line " + std::to_string(ex.line) + ")");
    return out;
  }

  Walker walker(blocked_modules_, out);
  walker.Visit(*parsed.root);
  for (auto& warning : parsed.warnings) {
    out.warnings.push_back(std::move(warning));
  }
  for (const auto& pattern : kDangerousPatterns) {
    if (code.find(pattern.needle) != std::string_view::npos) {
      out.warnings.push_back("Potentially dangerous pattern: " + std::string(pattern.description));
    }
  }

  out.complexity_score = std::min(kMaxComplexityScore, walker.complexity());
  out.detected_permissions.assign(walker.permissions().begin(), walker.permissions().end());
  out.is_safe = out.issues.empty();
  return out;
}

AnalysisCache::AnalysisCache(size_t capacity, std::shared_ptr<crypto::CryptoProvider> crypto)
    : capacity_(capacity), crypto_(crypto ? std::move(crypto) : crypto::MakeOpenSSLCryptoProvider()) {}

std::string AnalysisCache::KeyFor(std::string_view code, const std::vector<std::string>& blocked) const {
  auto sorted = blocked;
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  std::string material(code);
  material.push_back('\0');
  material += Join(sorted, ",");
  return crypto::Sha256Hex(*crypto_, material);
}

AnalysisResult AnalysisCache::Analyze(std::string_view code,
                                      const std::vector<std::string>& extra_blocked_modules) {
  const auto key = KeyFor(code, extra_blocked_modules);
  {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      it->second->last_used.store(++tick_);
      ++hits_;
      return it->second->result;
    }
  }
  ++misses_;
  auto result = CodeAnalyzer(extra_blocked_modules).Analyze(code);
  if (capacity_ == 0) {
    return result;
  }

  std::unique_lock lock(mutex_);
  if (entries_.find(key) == entries_.end()) {
    while (entries_.size() >= capacity_) {
      EvictOldestLocked();
    }
    auto entry = std::make_unique<Entry>();
    entry->result = result;
    entry->last_used.store(++tick_);
    entries_.emplace(key, std::move(entry));
  }
  return result;
}

size_t AnalysisCache::size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

void AnalysisCache::EvictOldestLocked() {
  auto oldest = entries_.end();
  uint64_t oldest_tick = UINT64_MAX;
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    const auto used = it->second->last_used.load();
    if (used < oldest_tick) {
      oldest_tick = used;
      oldest = it;
    }
  }
  if (oldest != entries_.end()) {
    entries_.erase(oldest);
  }
}

}  // namespace warden::analysis
