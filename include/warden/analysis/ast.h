#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace warden::analysis {

enum class NodeKind : uint8_t {
  // Statements
  kModule,
  kFunctionDef,
  kAsyncFunctionDef,
  kClassDef,
  kReturn,
  kDelete,
  kAssign,
  kAugAssign,
  kAnnAssign,
  kFor,
  kAsyncFor,
  kWhile,
  kIf,
  kWith,
  kAsyncWith,
  kRaise,
  kTry,
  kTryStar,
  kExceptHandler,
  kAssert,
  kImport,
  kImportFrom,
  kAlias,
  kGlobal,
  kNonlocal,
  kExpr,
  kPass,
  kBreak,
  kContinue,
  // Expressions
  kBoolOp,
  kNamedExpr,
  kBinOp,
  kUnaryOp,
  kLambda,
  kIfExp,
  kDict,
  kSet,
  kListComp,
  kSetComp,
  kDictComp,
  kGeneratorExp,
  kComprehension,
  kAwait,
  kYield,
  kYieldFrom,
  kCompare,
  kCall,
  kKeyword,
  kJoinedStr,
  kFormattedValue,
  kConstant,
  kAttribute,
  kSubscript,
  kSlice,
  kStarred,
  kName,
  kList,
  kTuple,
  kArguments,
  kArg
};

// Untyped syntax tree node. Children are kept in source order; the meaning of
// text depends on the kind:
//   kName, kArg, kKeyword     identifier (kKeyword: empty for **kwargs)
//   kAttribute                attribute name, child 0 is the value
//   kCall                     child 0 is the callee
//   kAlias                    dotted module name or imported member
//   kImportFrom               module (may be empty), level holds the dots
//   kFunctionDef, kClassDef   definition name
//   kConstant                 literal source text
//   kBinOp, kUnaryOp, ...     operator
//   kExceptHandler            flag is true for a bare "except:"
struct Node {
  NodeKind kind{NodeKind::kPass};
  int line{0};
  std::string text;
  int level{0};
  bool flag{false};
  std::vector<std::unique_ptr<Node>> children;

  Node(NodeKind k, int at_line, std::string t = {}) : kind(k), line(at_line), text(std::move(t)) {}

  Node* Add(std::unique_ptr<Node> child) {
    children.push_back(std::move(child));
    return children.back().get();
  }
};

using NodePtr = std::unique_ptr<Node>;

}  // namespace warden::analysis
