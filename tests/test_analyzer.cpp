#include "warden/analysis/analyzer.h"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "warden/analysis/parser.h"

namespace {

using warden::analysis::AnalysisCache;
using warden::analysis::CodeAnalyzer;

bool Has(const std::vector<std::string>& values, const std::string& needle) {
  return std::find(values.begin(), values.end(), needle) != values.end();
}

bool AnyStartsWith(const std::vector<std::string>& values, const std::string& prefix) {
  return std::any_of(values.begin(), values.end(),
                     [&prefix](const std::string& v) { return v.rfind(prefix, 0) == 0; });
}

constexpr const char* kSafeValidator = R"PY(
import math
import statistics
from collections import Counter

def validate(values, params=None):
    """Counts missing values."""
    null_count = sum(1 for v in values if v is None)
    numbers = [v for v in values if isinstance(v, (int, float))]
    summary = {"mean": statistics.mean(numbers) if numbers else 0,
               "spread": math.sqrt(len(numbers))}
    counts = Counter(type(v).__name__ for v in values)
    label = f"{null_count} nulls in {len(values)} rows"
    return {"passed": null_count == 0, "issues": [], "message": label,
            "details": {"null_count": null_count, **summary, "types": dict(counts)}}
)PY";

void TestBlockedCall() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze("def validate(values):\n    return eval('1 + 1')\n");
  assert(!result.is_safe);
  assert(Has(result.issues, "Blocked function call: eval"));
  assert(Has(result.blocked_constructs, "call:eval"));
}

void TestSafeCode() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze(kSafeValidator);
  assert(result.is_safe);
  assert(result.issues.empty());
  assert(result.detected_permissions.empty());
  assert(Has(result.detected_imports, "math"));
  assert(Has(result.detected_imports, "collections"));
  assert(result.complexity_score > 0);
  assert(result.complexity_score <= warden::analysis::kMaxComplexityScore);
}

void TestBlockedImportAndAttributes() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze("import os.path\nx = ().__class__.__bases__\n");
  assert(!result.is_safe);
  assert(Has(result.issues, "Blocked module import: os"));
  assert(Has(result.blocked_constructs, "import:os"));
  assert(Has(result.blocked_constructs, "attr:__class__"));
  assert(Has(result.blocked_constructs, "attr:__bases__"));
  assert(Has(result.detected_imports, "os.path"));

  auto from_import = analyzer.Analyze("from subprocess import run\n");
  assert(!from_import.is_safe);
  assert(Has(from_import.blocked_constructs, "import:subprocess"));
}

void TestPrivateAttributes() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze(
      "import random\n"
      "def validate(values):\n"
      "    random._os.listdir('/')\n"
      "    return {'passed': True}\n");
  assert(!result.is_safe);
  assert(Has(result.issues, "Private attribute access: _os"));
  assert(Has(result.blocked_constructs, "attr:_os"));

  auto dunder = analyzer.Analyze("import math\nname = math.__name__\n");
  assert(dunder.is_safe);
  assert(!AnyStartsWith(dunder.blocked_constructs, "attr:"));

  assert(warden::analysis::IsPrivateAttribute("_os"));
  assert(warden::analysis::IsPrivateAttribute("__os"));
  assert(warden::analysis::IsPrivateAttribute("_"));
  assert(warden::analysis::IsPrivateAttribute("____"));
  assert(!warden::analysis::IsPrivateAttribute("__name__"));
  assert(!warden::analysis::IsPrivateAttribute("listdir"));
}

void TestPermissionImports() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze("import pathlib\nimport ssl\nimport pathlib\n");
  assert(result.is_safe);
  assert(Has(result.warnings, "Import requires permission: pathlib"));
  assert(result.detected_permissions.size() == 2);
  assert(result.detected_permissions[0] == "file_system");
  assert(result.detected_permissions[1] == "network_access");

  CodeAnalyzer strict({"pathlib"});
  auto blocked = strict.Analyze("import pathlib\n");
  assert(!blocked.is_safe);
  assert(Has(blocked.issues, "Blocked module import: pathlib"));
}

void TestSyntaxError() {
  CodeAnalyzer analyzer;
  auto result = analyzer.Analyze("def validate(values):\n    return (1 +\n\nx = 1\n");
  assert(!result.is_safe);
  assert(result.issues.size() == 1);
  assert(AnyStartsWith(result.issues, "Syntax error: "));

  bool threw = false;
  try {
    (void)warden::analysis::ParseModule("if True\n    pass\n");
  } catch (const warden::analysis::SyntaxError& ex) {
    threw = ex.line == 1;
  }
  assert(threw);
}

void TestWarnings() {
  CodeAnalyzer analyzer;
  const char* code =
      "def f(rows):\n"
      "    for a in rows:\n"
      "        for b in a:\n"
      "            for c in b:\n"
      "                for d in c:\n"
      "                    try:\n"
      "                        d.value()\n"
      "                    except:\n"
      "                        pass\n"
      "    return 'pickle.loads'\n";
  auto result = analyzer.Analyze(code);
  assert(result.is_safe);
  assert(Has(result.warnings, "Bare except clause found"));
  assert(Has(result.warnings, "Deeply nested loops (depth > 3)"));
  assert(Has(result.warnings, "Potentially dangerous pattern: pickle usage"));
}

void TestModernSyntaxParses() {
  CodeAnalyzer analyzer;
  const char* code =
      "import json\n"
      "@staticmethod\n"
      "def helper(*args, key=None, **kwargs) -> dict:\n"
      "    if (n := len(args)) > 2:\n"
      "        return {k: v for k, v in kwargs.items()}\n"
      "    squares = [x * x for x in range(n) if x % 2 == 0]\n"
      "    pick = lambda item: item[0]\n"
      "    with open_resource() as handle, other() as second:\n"
      "        pass\n"
      "    return {'n': n, 'first': squares[0] if squares else None, 'pick': pick}\n"
      "class Report:\n"
      "    title: str = 'x'\n"
      "    async def render(self):\n"
      "        await self.flush()\n"
      "        yield json.dumps({'title': self.title})\n";
  auto result = analyzer.Analyze(code);
  assert(result.is_safe);
  assert(!AnyStartsWith(result.issues, "Syntax error"));
}

void TestCacheIsStable() {
  AnalysisCache cache(2);
  auto first = cache.Analyze(kSafeValidator);
  auto second = cache.Analyze(kSafeValidator);
  assert(first == second);
  assert(cache.hits() == 1);
  assert(cache.misses() == 1);

  // A different block list is a different key.
  auto restricted = cache.Analyze(kSafeValidator, {"statistics"});
  assert(!restricted.is_safe);
  assert(cache.misses() == 2);
  assert(cache.size() == 2);

  (void)cache.Analyze("x = 1\n");
  assert(cache.size() == 2);
  assert(cache.misses() == 3);

  // Same result whether served from the cache or recomputed.
  assert(CodeAnalyzer().Analyze(kSafeValidator) == first);
}

}  // namespace

int main() {
  TestBlockedCall();
  TestSafeCode();
  TestBlockedImportAndAttributes();
  TestPrivateAttributes();
  TestPermissionImports();
  TestSyntaxError();
  TestWarnings();
  TestModernSyntaxParses();
  TestCacheIsStable();

  std::cout << "analyzer tests ok\n";
  return 0;
}
