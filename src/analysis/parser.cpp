#include "warden/analysis/parser.h"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <optional>

#include "warden/common.h"

namespace warden::analysis {

namespace {

constexpr std::array<std::string_view, 13> kAugmentedOps = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="};

bool IsAugmentedOp(const Token& token) {
  return token.kind == TokenKind::kOp &&
         std::find(kAugmentedOps.begin(), kAugmentedOps.end(), token.text) != kAugmentedOps.end();
}

NodePtr MakeNode(NodeKind kind, int line, std::string text = {}) {
  return std::make_unique<Node>(kind, line, std::move(text));
}

std::string DescribeForAssignment(const Node& node) {
  switch (node.kind) {
  case NodeKind::kCall:
    return "function call";
  case NodeKind::kConstant:
  case NodeKind::kJoinedStr:
    return "literal";
  case NodeKind::kCompare:
    return "comparison";
  case NodeKind::kLambda:
    return "lambda";
  case NodeKind::kIfExp:
    return "conditional expression";
  case NodeKind::kNamedExpr:
    return "named expression";
  case NodeKind::kAwait:
    return "await expression";
  case NodeKind::kYield:
  case NodeKind::kYieldFrom:
    return "yield expression";
  case NodeKind::kGeneratorExp:
    return "generator expression";
  case NodeKind::kListComp:
    return "list comprehension";
  case NodeKind::kDict:
    return "dict literal";
  case NodeKind::kSet:
    return "set display";
  default:
    return "expression";
  }
}

class Parser {
public:
  Parser(std::vector<Token> tokens, std::vector<std::string>& warnings)
      : tokens_(std::move(tokens)), warnings_(warnings) {}

  NodePtr ParseFile() {
    auto root = MakeNode(NodeKind::kModule, 1);
    while (Peek().kind != TokenKind::kEndMarker) {
      if (Peek().kind == TokenKind::kNewline) {
        Advance();
        continue;
      }
      ParseStatement(*root);
    }
    return root;
  }

  // Parses one parenthesised expression produced for an f-string field.
  NodePtr ParseStandaloneExpression() {
    auto expr = ParseTestListStarExpr();
    while (Peek().kind == TokenKind::kNewline) {
      Advance();
    }
    if (Peek().kind != TokenKind::kEndMarker) {
      Fail("invalid syntax");
    }
    return expr;
  }

private:
  // ---- token helpers -------------------------------------------------------

  const Token& Peek(size_t ahead = 0) const {
    const size_t index = std::min(pos_ + ahead, tokens_.size() - 1);
    return tokens_[index];
  }

  const Token& Advance() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
      ++pos_;
    }
    return token;
  }

  bool IsOp(std::string_view op, size_t ahead = 0) const {
    const auto& token = Peek(ahead);
    return token.kind == TokenKind::kOp && token.text == op;
  }

  bool IsKeyword(std::string_view word, size_t ahead = 0) const {
    const auto& token = Peek(ahead);
    return token.kind == TokenKind::kName && token.text == word;
  }

  bool IsIdentifier(size_t ahead = 0) const {
    const auto& token = Peek(ahead);
    return token.kind == TokenKind::kName && !analysis::IsKeyword(token.text);
  }

  bool AcceptOp(std::string_view op) {
    if (IsOp(op)) {
      Advance();
      return true;
    }
    return false;
  }

  bool AcceptKeyword(std::string_view word) {
    if (IsKeyword(word)) {
      Advance();
      return true;
    }
    return false;
  }

  [[noreturn]] void Fail(const std::string& message) const { throw SyntaxError(message, Peek().line); }

  void ExpectOp(std::string_view op) {
    if (!AcceptOp(op)) {
      Fail(op == ":" ? "expected ':'" : "invalid syntax");
    }
  }

  void ExpectKeyword(std::string_view word) {
    if (!AcceptKeyword(word)) {
      Fail("invalid syntax");
    }
  }

  std::string ExpectName() {
    if (!IsIdentifier()) {
      Fail("invalid syntax");
    }
    return Advance().text;
  }

  void ExpectNewline() {
    if (Peek().kind == TokenKind::kNewline) {
      Advance();
      return;
    }
    if (Peek().kind != TokenKind::kEndMarker) {
      Fail("invalid syntax");
    }
  }

  bool AtStatementEnd() const {
    const auto kind = Peek().kind;
    return kind == TokenKind::kNewline || kind == TokenKind::kEndMarker || IsOp(";");
  }

  bool AtTupleEnd() const {
    if (AtStatementEnd() || IsAugmentedOp(Peek())) {
      return true;
    }
    for (auto op : {"=", ":", ")", "]", "}"}) {
      if (IsOp(op)) {
        return true;
      }
    }
    return IsKeyword("in") || IsKeyword("for");
  }

  bool IsCompFor() const { return IsKeyword("for") || (IsKeyword("async") && IsKeyword("for", 1)); }

  // ---- statements ----------------------------------------------------------

  void ParseStatement(Node& parent) {
    const auto& token = Peek();
    if (token.kind == TokenKind::kIndent) {
      Fail("unexpected indent");
    }
    if (token.kind == TokenKind::kDedent) {
      Fail("unindent does not match any outer indentation level");
    }
    if (token.kind == TokenKind::kOp && token.text == "@") {
      parent.Add(ParseDecorated());
      return;
    }
    if (token.kind == TokenKind::kName) {
      const auto& word = token.text;
      if (word == "if") {
        parent.Add(ParseIf());
        return;
      }
      if (word == "while") {
        parent.Add(ParseWhile());
        return;
      }
      if (word == "for") {
        parent.Add(ParseFor(false));
        return;
      }
      if (word == "try") {
        parent.Add(ParseTry());
        return;
      }
      if (word == "with") {
        parent.Add(ParseWith(false));
        return;
      }
      if (word == "def") {
        parent.Add(ParseFunction(false, {}));
        return;
      }
      if (word == "class") {
        parent.Add(ParseClass({}));
        return;
      }
      if (word == "async" && (IsKeyword("def", 1) || IsKeyword("for", 1) || IsKeyword("with", 1))) {
        Advance();
        if (IsKeyword("def")) {
          parent.Add(ParseFunction(true, {}));
        } else if (IsKeyword("for")) {
          parent.Add(ParseFor(true));
        } else {
          parent.Add(ParseWith(true));
        }
        return;
      }
    }
    ParseSimpleStatements(parent);
  }

  void ParseSimpleStatements(Node& parent) {
    parent.Add(ParseSmallStatement());
    while (AcceptOp(";")) {
      if (AtStatementEnd()) {
        break;
      }
      parent.Add(ParseSmallStatement());
    }
    ExpectNewline();
  }

  void ParseBlock(Node& parent) {
    ExpectOp(":");
    if (Peek().kind != TokenKind::kNewline) {
      ParseSimpleStatements(parent);
      return;
    }
    Advance();
    if (Peek().kind != TokenKind::kIndent) {
      Fail("expected an indented block");
    }
    Advance();
    while (Peek().kind != TokenKind::kDedent && Peek().kind != TokenKind::kEndMarker) {
      if (Peek().kind == TokenKind::kNewline) {
        Advance();
        continue;
      }
      ParseStatement(parent);
    }
    if (Peek().kind == TokenKind::kDedent) {
      Advance();
    }
  }

  NodePtr ParseIf() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kIf, line);
    node->Add(ParseNamedExpr());
    ParseBlock(*node);
    if (IsKeyword("elif")) {
      node->Add(ParseIf());
    } else if (AcceptKeyword("else")) {
      ParseBlock(*node);
    }
    return node;
  }

  NodePtr ParseWhile() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kWhile, line);
    node->Add(ParseNamedExpr());
    ParseBlock(*node);
    if (AcceptKeyword("else")) {
      ParseBlock(*node);
    }
    return node;
  }

  NodePtr ParseFor(bool is_async) {
    const int line = Advance().line;
    auto node = MakeNode(is_async ? NodeKind::kAsyncFor : NodeKind::kFor, line);
    auto target = ParseExprList();
    ValidateTarget(*target, "assign to");
    node->Add(std::move(target));
    ExpectKeyword("in");
    node->Add(ParseTestListStarExpr());
    ParseBlock(*node);
    if (AcceptKeyword("else")) {
      ParseBlock(*node);
    }
    return node;
  }

  NodePtr ParseTry() {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kTry, line);
    ParseBlock(*node);
    bool plain = false;
    bool starred = false;
    while (IsKeyword("except")) {
      auto handler = MakeNode(NodeKind::kExceptHandler, Advance().line);
      const bool star = AcceptOp("*");
      (star ? starred : plain) = true;
      if (plain && starred) {
        Fail("cannot have both 'except' and 'except*' on the same 'try'");
      }
      if (IsOp(":")) {
        if (star) {
          Fail("expected one or more exception types");
        }
        handler->flag = true;
      } else {
        handler->Add(ParseTest());
        if (AcceptKeyword("as")) {
          handler->Add(MakeNode(NodeKind::kName, Peek().line, ExpectName()));
        } else if (IsOp(",")) {
          Fail("multiple exception types must be parenthesized");
        }
      }
      ParseBlock(*handler);
      node->Add(std::move(handler));
    }
    if (starred) {
      node->kind = NodeKind::kTryStar;
    }
    const bool has_handlers = plain || starred;
    if (has_handlers && AcceptKeyword("else")) {
      ParseBlock(*node);
    }
    if (AcceptKeyword("finally")) {
      ParseBlock(*node);
    } else if (!has_handlers) {
      Fail("expected 'except' or 'finally' block");
    }
    return node;
  }

  NodePtr ParseWith(bool is_async) {
    const int line = Advance().line;
    auto node = MakeNode(is_async ? NodeKind::kAsyncWith : NodeKind::kWith, line);
    if (IsOp("(") && TryParenthesizedWithItems(*node)) {
      ParseBlock(*node);
      return node;
    }
    do {
      ParseWithItem(*node);
    } while (AcceptOp(","));
    ParseBlock(*node);
    return node;
  }

  // "with (a as b, c as d):" form. Restores the position when the parenthesis
  // turns out to belong to an ordinary expression.
  bool TryParenthesizedWithItems(Node& node) {
    const size_t saved_pos = pos_;
    const size_t saved_warnings = warnings_.size();
    const size_t saved_children = node.children.size();
    try {
      Advance();
      do {
        if (IsOp(")")) {
          break;
        }
        ParseWithItem(node);
      } while (AcceptOp(","));
      ExpectOp(")");
      if (!IsOp(":")) {
        Fail("invalid syntax");
      }
      return true;
    } catch (const SyntaxError&) {
      pos_ = saved_pos;
      warnings_.resize(saved_warnings);
      node.children.resize(saved_children);
      return false;
    }
  }

  void ParseWithItem(Node& node) {
    node.Add(ParseTest());
    if (AcceptKeyword("as")) {
      auto target = ParseStarOrBitOr();
      ValidateTarget(*target, "assign to");
      node.Add(std::move(target));
    }
  }

  NodePtr ParseDecorated() {
    std::vector<NodePtr> decorators;
    while (AcceptOp("@")) {
      decorators.push_back(ParseNamedExpr());
      ExpectNewline();
    }
    if (IsKeyword("def")) {
      return ParseFunction(false, std::move(decorators));
    }
    if (IsKeyword("async") && IsKeyword("def", 1)) {
      Advance();
      return ParseFunction(true, std::move(decorators));
    }
    if (IsKeyword("class")) {
      return ParseClass(std::move(decorators));
    }
    Fail("invalid syntax");
  }

  NodePtr ParseFunction(bool is_async, std::vector<NodePtr> decorators) {
    const int line = Advance().line;
    auto node = MakeNode(is_async ? NodeKind::kAsyncFunctionDef : NodeKind::kFunctionDef, line, ExpectName());
    for (auto& decorator : decorators) {
      node->Add(std::move(decorator));
    }
    ExpectOp("(");
    node->Add(ParseParameters(")", true));
    ExpectOp(")");
    if (AcceptOp("->")) {
      node->Add(ParseTest());
    }
    ParseBlock(*node);
    return node;
  }

  NodePtr ParseClass(std::vector<NodePtr> decorators) {
    const int line = Advance().line;
    auto node = MakeNode(NodeKind::kClassDef, line, ExpectName());
    for (auto& decorator : decorators) {
      node->Add(std::move(decorator));
    }
    if (AcceptOp("(")) {
      ParseCallArguments(*node);
      ExpectOp(")");
    }
    ParseBlock(*node);
    return node;
  }

  NodePtr ParseParameters(std::string_view close, bool annotations) {
    auto args = MakeNode(NodeKind::kArguments, Peek().line);
    bool seen_default = false;
    bool keyword_only = false;
    while (!IsOp(close)) {
      if (AcceptOp("/")) {
        // positional-only marker
      } else if (AcceptOp("**")) {
        args->Add(ParseParameter(annotations));
      } else if (AcceptOp("*")) {
        keyword_only = true;
        if (IsIdentifier()) {
          args->Add(ParseParameter(annotations));
        }
      } else {
        auto param = ParseParameter(annotations);
        if (AcceptOp("=")) {
          param->Add(ParseTest());
          seen_default = true;
        } else if (seen_default && !keyword_only) {
          Fail("non-default argument follows default argument");
        }
        args->Add(std::move(param));
      }
      if (!AcceptOp(",")) {
        break;
      }
    }
    return args;
  }

  NodePtr ParseParameter(bool annotations) {
    const int line = Peek().line;
    auto param = MakeNode(NodeKind::kArg, line, ExpectName());
    if (annotations && AcceptOp(":")) {
      param->Add(ParseTest());
    }
    return param;
  }

  NodePtr ParseSmallStatement() {
    const auto& token = Peek();
    const int line = token.line;
    if (token.kind == TokenKind::kName) {
      const auto word = token.text;
      if (word == "pass" || word == "break" || word == "continue") {
        Advance();
        const auto kind = word == "pass" ? NodeKind::kPass
                                         : (word == "break" ? NodeKind::kBreak : NodeKind::kContinue);
        return MakeNode(kind, line);
      }
      if (word == "return") {
        Advance();
        auto node = MakeNode(NodeKind::kReturn, line);
        if (!AtStatementEnd()) {
          node->Add(ParseTestListStarExpr());
        }
        return node;
      }
      if (word == "raise") {
        Advance();
        auto node = MakeNode(NodeKind::kRaise, line);
        if (!AtStatementEnd()) {
          node->Add(ParseTest());
          if (AcceptKeyword("from")) {
            node->Add(ParseTest());
          }
        }
        return node;
      }
      if (word == "global" || word == "nonlocal") {
        Advance();
        auto node = MakeNode(word == "global" ? NodeKind::kGlobal : NodeKind::kNonlocal, line);
        do {
          node->Add(MakeNode(NodeKind::kName, Peek().line, ExpectName()));
        } while (AcceptOp(","));
        return node;
      }
      if (word == "del") {
        Advance();
        auto node = MakeNode(NodeKind::kDelete, line);
        auto targets = ParseExprList();
        ValidateTarget(*targets, "delete");
        node->Add(std::move(targets));
        return node;
      }
      if (word == "assert") {
        Advance();
        auto node = MakeNode(NodeKind::kAssert, line);
        node->Add(ParseTest());
        if (AcceptOp(",")) {
          node->Add(ParseTest());
        }
        return node;
      }
      if (word == "import") {
        return ParseImport();
      }
      if (word == "from") {
        return ParseImportFrom();
      }
    }
    return ParseExpressionStatement();
  }

  std::string ParseDottedName() {
    std::string name = ExpectName();
    while (IsOp(".")) {
      Advance();
      name += ".";
      name += ExpectName();
    }
    return name;
  }

  NodePtr ParseImport() {
    auto node = MakeNode(NodeKind::kImport, Advance().line);
    do {
      const int line = Peek().line;
      node->Add(MakeNode(NodeKind::kAlias, line, ParseDottedName()));
      if (AcceptKeyword("as")) {
        ExpectName();
      }
    } while (AcceptOp(","));
    return node;
  }

  NodePtr ParseImportFrom() {
    const int line = Advance().line;
    int level = 0;
    while (IsOp(".") || IsOp("...")) {
      level += IsOp(".") ? 1 : 3;
      Advance();
    }
    std::string module;
    if (!IsKeyword("import")) {
      module = ParseDottedName();
    } else if (level == 0) {
      Fail("invalid syntax");
    }
    ExpectKeyword("import");
    auto node = MakeNode(NodeKind::kImportFrom, line, module);
    node->level = level;
    if (IsOp("*")) {
      node->Add(MakeNode(NodeKind::kAlias, Advance().line, "*"));
      return node;
    }
    const bool parenthesized = AcceptOp("(");
    do {
      if (parenthesized && IsOp(")")) {
        break;
      }
      const int alias_line = Peek().line;
      node->Add(MakeNode(NodeKind::kAlias, alias_line, ExpectName()));
      if (AcceptKeyword("as")) {
        ExpectName();
      }
    } while (AcceptOp(","));
    if (parenthesized) {
      ExpectOp(")");
    } else if (node->children.empty()) {
      Fail("invalid syntax");
    }
    return node;
  }

  NodePtr ParseExpressionStatement() {
    const int line = Peek().line;
    auto first = IsKeyword("yield") ? ParseYield() : ParseTestListStarExpr();

    if (IsOp(":")) {
      Advance();
      if (first->kind == NodeKind::kTuple) {
        throw SyntaxError("only single target (not tuple) can be annotated", line);
      }
      if (first->kind != NodeKind::kName && first->kind != NodeKind::kAttribute &&
          first->kind != NodeKind::kSubscript) {
        throw SyntaxError("illegal target for annotation", line);
      }
      auto node = MakeNode(NodeKind::kAnnAssign, line);
      node->Add(std::move(first));
      node->Add(ParseTest());
      if (AcceptOp("=")) {
        node->Add(IsKeyword("yield") ? ParseYield() : ParseTestListStarExpr());
      }
      return node;
    }

    if (IsAugmentedOp(Peek())) {
      auto node = MakeNode(NodeKind::kAugAssign, line, Advance().text);
      if (first->kind != NodeKind::kName && first->kind != NodeKind::kAttribute &&
          first->kind != NodeKind::kSubscript) {
        throw SyntaxError("'" + DescribeForAssignment(*first) +
                              "' is an illegal expression for augmented assignment",
                          line);
      }
      node->Add(std::move(first));
      node->Add(IsKeyword("yield") ? ParseYield() : ParseTestListStarExpr());
      return node;
    }

    if (IsOp("=")) {
      std::vector<NodePtr> parts;
      parts.push_back(std::move(first));
      while (AcceptOp("=")) {
        parts.push_back(IsKeyword("yield") ? ParseYield() : ParseTestListStarExpr());
      }
      auto node = MakeNode(NodeKind::kAssign, line);
      for (size_t i = 0; i + 1 < parts.size(); ++i) {
        ValidateTarget(*parts[i], "assign to");
      }
      for (auto& part : parts) {
        node->Add(std::move(part));
      }
      return node;
    }

    auto node = MakeNode(NodeKind::kExpr, line);
    node->Add(std::move(first));
    return node;
  }

  void ValidateTarget(const Node& node, const char* verb) const {
    switch (node.kind) {
    case NodeKind::kName:
    case NodeKind::kAttribute:
    case NodeKind::kSubscript:
      return;
    case NodeKind::kStarred:
    case NodeKind::kTuple:
    case NodeKind::kList:
      for (const auto& child : node.children) {
        ValidateTarget(*child, verb);
      }
      return;
    default:
      throw SyntaxError(std::string("cannot ") + verb + " " + DescribeForAssignment(node), node.line);
    }
  }

  // ---- expressions ---------------------------------------------------------

  NodePtr ParseTestListStarExpr() {
    const int line = Peek().line;
    auto first = ParseStarOrTest();
    if (!IsOp(",")) {
      return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (AtTupleEnd()) {
        break;
      }
      tuple->Add(ParseStarOrTest());
    }
    return tuple;
  }

  NodePtr ParseExprList() {
    const int line = Peek().line;
    auto first = ParseStarOrBitOr();
    if (!IsOp(",")) {
      return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (AtTupleEnd()) {
        break;
      }
      tuple->Add(ParseStarOrBitOr());
    }
    return tuple;
  }

  NodePtr ParseStarOrTest() {
    if (IsOp("*")) {
      auto node = MakeNode(NodeKind::kStarred, Advance().line);
      node->Add(ParseBitOr());
      return node;
    }
    return ParseTest();
  }

  NodePtr ParseStarOrBitOr() {
    if (IsOp("*")) {
      auto node = MakeNode(NodeKind::kStarred, Advance().line);
      node->Add(ParseBitOr());
      return node;
    }
    return ParseBitOr();
  }

  NodePtr ParseStarOrNamed() {
    if (IsOp("*")) {
      auto node = MakeNode(NodeKind::kStarred, Advance().line);
      node->Add(ParseBitOr());
      return node;
    }
    return ParseNamedExpr();
  }

  NodePtr ParseNamedExpr() {
    if (IsIdentifier() && IsOp(":=", 1)) {
      const auto& name = Advance();
      auto node = MakeNode(NodeKind::kNamedExpr, name.line);
      node->Add(MakeNode(NodeKind::kName, name.line, name.text));
      Advance();
      node->Add(ParseTest());
      return node;
    }
    return ParseTest();
  }

  NodePtr ParseTest() {
    if (IsKeyword("lambda")) {
      return ParseLambda();
    }
    auto body = ParseOrTest();
    if (!IsKeyword("if")) {
      return body;
    }
    auto node = MakeNode(NodeKind::kIfExp, Advance().line);
    node->Add(std::move(body));
    node->Add(ParseOrTest());
    ExpectKeyword("else");
    node->Add(ParseTest());
    return node;
  }

  NodePtr ParseLambda() {
    auto node = MakeNode(NodeKind::kLambda, Advance().line);
    node->Add(ParseParameters(":", false));
    ExpectOp(":");
    node->Add(ParseTest());
    return node;
  }

  NodePtr ParseOrTest() { return ParseBoolChain("or", &Parser::ParseAndTest); }
  NodePtr ParseAndTest() { return ParseBoolChain("and", &Parser::ParseNotTest); }

  NodePtr ParseBoolChain(std::string_view word, NodePtr (Parser::*next)()) {
    auto left = (this->*next)();
    if (!IsKeyword(word)) {
      return left;
    }
    auto node = MakeNode(NodeKind::kBoolOp, left->line, std::string(word));
    node->Add(std::move(left));
    while (AcceptKeyword(word)) {
      node->Add((this->*next)());
    }
    return node;
  }

  NodePtr ParseNotTest() {
    if (IsKeyword("not")) {
      auto node = MakeNode(NodeKind::kUnaryOp, Advance().line, "not");
      node->Add(ParseNotTest());
      return node;
    }
    return ParseComparison();
  }

  std::optional<std::string> AcceptComparisonOp() {
    for (auto op : {"<", ">", "==", ">=", "<=", "!="}) {
      if (AcceptOp(op)) {
        return std::string(op);
      }
    }
    if (AcceptKeyword("in")) {
      return std::string("in");
    }
    if (IsKeyword("not") && IsKeyword("in", 1)) {
      Advance();
      Advance();
      return std::string("not in");
    }
    if (AcceptKeyword("is")) {
      return std::string(AcceptKeyword("not") ? "is not" : "is");
    }
    return std::nullopt;
  }

  NodePtr ParseComparison() {
    auto left = ParseBitOr();
    auto op = AcceptComparisonOp();
    if (!op) {
      return left;
    }
    auto node = MakeNode(NodeKind::kCompare, left->line, *op);
    node->Add(std::move(left));
    node->Add(ParseBitOr());
    while (AcceptComparisonOp()) {
      node->Add(ParseBitOr());
    }
    return node;
  }

  NodePtr ParseBinaryLevel(size_t level) {
    static const std::array<std::vector<std::string_view>, 6> kLevels = {{
        {"|"},
        {"^"},
        {"&"},
        {"<<", ">>"},
        {"+", "-"},
        {"*", "/", "//", "%", "@"},
    }};
    if (level >= kLevels.size()) {
      return ParseFactor();
    }
    auto left = ParseBinaryLevel(level + 1);
    while (true) {
      const auto& ops = kLevels[level];
      auto it = std::find_if(ops.begin(), ops.end(), [this](std::string_view op) { return IsOp(op); });
      if (it == ops.end()) {
        return left;
      }
      auto node = MakeNode(NodeKind::kBinOp, Advance().line, std::string(*it));
      node->Add(std::move(left));
      node->Add(ParseBinaryLevel(level + 1));
      left = std::move(node);
    }
  }

  NodePtr ParseBitOr() { return ParseBinaryLevel(0); }

  NodePtr ParseFactor() {
    if (IsOp("+") || IsOp("-") || IsOp("~")) {
      const auto& token = Advance();
      auto node = MakeNode(NodeKind::kUnaryOp, token.line, token.text);
      node->Add(ParseFactor());
      return node;
    }
    return ParsePower();
  }

  NodePtr ParsePower() {
    auto base = ParseAwaitPrimary();
    if (!IsOp("**")) {
      return base;
    }
    auto node = MakeNode(NodeKind::kBinOp, Advance().line, "**");
    node->Add(std::move(base));
    node->Add(ParseFactor());
    return node;
  }

  NodePtr ParseAwaitPrimary() {
    if (IsKeyword("await")) {
      auto node = MakeNode(NodeKind::kAwait, Advance().line);
      node->Add(ParsePrimary());
      return node;
    }
    return ParsePrimary();
  }

  NodePtr ParsePrimary() {
    auto node = ParseAtom();
    while (true) {
      if (IsOp("(")) {
        auto call = MakeNode(NodeKind::kCall, Advance().line);
        call->Add(std::move(node));
        ParseCallArguments(*call);
        ExpectOp(")");
        node = std::move(call);
      } else if (IsOp("[")) {
        auto subscript = MakeNode(NodeKind::kSubscript, Advance().line);
        subscript->Add(std::move(node));
        subscript->Add(ParseSubscriptList());
        ExpectOp("]");
        node = std::move(subscript);
      } else if (IsOp(".")) {
        const int line = Advance().line;
        auto attribute = MakeNode(NodeKind::kAttribute, line, ExpectName());
        attribute->Add(std::move(node));
        node = std::move(attribute);
      } else {
        return node;
      }
    }
  }

  void ParseCallArguments(Node& call) {
    bool seen_keyword = false;
    while (!IsOp(")")) {
      if (IsOp("*")) {
        auto starred = MakeNode(NodeKind::kStarred, Advance().line);
        starred->Add(ParseTest());
        call.Add(std::move(starred));
      } else if (IsOp("**")) {
        auto keyword = MakeNode(NodeKind::kKeyword, Advance().line);
        keyword->Add(ParseTest());
        call.Add(std::move(keyword));
        seen_keyword = true;
      } else if (IsIdentifier() && IsOp("=", 1)) {
        const auto& name = Advance();
        auto keyword = MakeNode(NodeKind::kKeyword, name.line, name.text);
        Advance();
        keyword->Add(ParseTest());
        call.Add(std::move(keyword));
        seen_keyword = true;
      } else {
        auto arg = ParseNamedExpr();
        if (IsCompFor()) {
          auto generator = MakeNode(NodeKind::kGeneratorExp, arg->line);
          generator->Add(std::move(arg));
          ParseComprehensions(*generator);
          arg = std::move(generator);
        } else if (seen_keyword) {
          Fail("positional argument follows keyword argument");
        }
        call.Add(std::move(arg));
      }
      if (!AcceptOp(",")) {
        break;
      }
    }
  }

  NodePtr ParseSubscriptList() {
    const int line = Peek().line;
    auto first = ParseSubscript();
    if (!IsOp(",")) {
      return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("]")) {
        break;
      }
      tuple->Add(ParseSubscript());
    }
    return tuple;
  }

  NodePtr ParseSubscript() {
    if (IsOp("*")) {
      return ParseStarOrNamed();
    }
    const int line = Peek().line;
    NodePtr lower;
    if (!IsOp(":")) {
      lower = ParseNamedExpr();
      if (!IsOp(":")) {
        return lower;
      }
    }
    auto slice = MakeNode(NodeKind::kSlice, line);
    if (lower) {
      slice->Add(std::move(lower));
    }
    ExpectOp(":");
    auto at_bound_end = [this]() { return IsOp("]") || IsOp(",") || IsOp(":"); };
    if (!at_bound_end()) {
      slice->Add(ParseTest());
    }
    if (AcceptOp(":") && !IsOp("]") && !IsOp(",")) {
      slice->Add(ParseTest());
    }
    return slice;
  }

  void ParseComprehensions(Node& owner) {
    while (IsCompFor()) {
      auto comp = MakeNode(NodeKind::kComprehension, Peek().line);
      comp->flag = AcceptKeyword("async");
      ExpectKeyword("for");
      auto target = ParseExprList();
      ValidateTarget(*target, "assign to");
      comp->Add(std::move(target));
      ExpectKeyword("in");
      comp->Add(ParseOrTest());
      while (AcceptKeyword("if")) {
        comp->Add(ParseOrTest());
      }
      owner.Add(std::move(comp));
    }
  }

  NodePtr ParseYield() {
    const int line = Advance().line;
    if (AcceptKeyword("from")) {
      auto node = MakeNode(NodeKind::kYieldFrom, line);
      node->Add(ParseTest());
      return node;
    }
    auto node = MakeNode(NodeKind::kYield, line);
    if (!AtStatementEnd() && !IsOp(")") && !IsOp("=") && !IsOp("]") && !IsOp("}")) {
      node->Add(ParseTestListStarExpr());
    }
    return node;
  }

  NodePtr ParseAtom() {
    const auto& token = Peek();
    switch (token.kind) {
    case TokenKind::kNumber:
      return MakeNode(NodeKind::kConstant, token.line, Advance().text);
    case TokenKind::kString:
      return ParseStrings();
    case TokenKind::kName: {
      if (token.text == "True" || token.text == "False" || token.text == "None") {
        return MakeNode(NodeKind::kConstant, token.line, Advance().text);
      }
      if (analysis::IsKeyword(token.text)) {
        Fail("invalid syntax");
      }
      return MakeNode(NodeKind::kName, token.line, Advance().text);
    }
    case TokenKind::kOp:
      if (token.text == "(") {
        return ParseParenthesized();
      }
      if (token.text == "[") {
        return ParseListDisplay();
      }
      if (token.text == "{") {
        return ParseBraceDisplay();
      }
      if (token.text == "...") {
        return MakeNode(NodeKind::kConstant, token.line, Advance().text);
      }
      break;
    default:
      break;
    }
    if (token.kind == TokenKind::kIndent) {
      Fail("unexpected indent");
    }
    if (token.kind == TokenKind::kNewline || token.kind == TokenKind::kEndMarker) {
      Fail("invalid syntax");
    }
    Fail("invalid syntax");
  }

  NodePtr ParseParenthesized() {
    const int line = Advance().line;
    if (AcceptOp(")")) {
      return MakeNode(NodeKind::kTuple, line);
    }
    if (IsKeyword("yield")) {
      auto node = ParseYield();
      ExpectOp(")");
      return node;
    }
    auto first = ParseStarOrNamed();
    if (IsCompFor()) {
      auto generator = MakeNode(NodeKind::kGeneratorExp, line);
      generator->Add(std::move(first));
      ParseComprehensions(*generator);
      ExpectOp(")");
      return generator;
    }
    if (!IsOp(",")) {
      ExpectOp(")");
      return first;
    }
    auto tuple = MakeNode(NodeKind::kTuple, line);
    tuple->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp(")")) {
        break;
      }
      tuple->Add(ParseStarOrNamed());
    }
    ExpectOp(")");
    return tuple;
  }

  NodePtr ParseListDisplay() {
    const int line = Advance().line;
    if (AcceptOp("]")) {
      return MakeNode(NodeKind::kList, line);
    }
    auto first = ParseStarOrNamed();
    if (IsCompFor()) {
      auto comp = MakeNode(NodeKind::kListComp, line);
      comp->Add(std::move(first));
      ParseComprehensions(*comp);
      ExpectOp("]");
      return comp;
    }
    auto list = MakeNode(NodeKind::kList, line);
    list->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("]")) {
        break;
      }
      list->Add(ParseStarOrNamed());
    }
    ExpectOp("]");
    return list;
  }

  NodePtr ParseBraceDisplay() {
    const int line = Advance().line;
    if (AcceptOp("}")) {
      return MakeNode(NodeKind::kDict, line);
    }
    // Dict when the first item is "k: v" or "**mapping".
    if (IsOp("**")) {
      auto dict = MakeNode(NodeKind::kDict, line);
      ParseDictItems(*dict);
      return dict;
    }
    auto first = ParseStarOrTest();
    if (first->kind != NodeKind::kStarred && AcceptOp(":")) {
      auto value = ParseTest();
      if (IsCompFor()) {
        auto comp = MakeNode(NodeKind::kDictComp, line);
        comp->Add(std::move(first));
        comp->Add(std::move(value));
        ParseComprehensions(*comp);
        ExpectOp("}");
        return comp;
      }
      auto dict = MakeNode(NodeKind::kDict, line);
      dict->Add(std::move(first));
      dict->Add(std::move(value));
      if (AcceptOp(",")) {
        ParseDictItems(*dict);
      } else {
        ExpectOp("}");
      }
      return dict;
    }
    if (IsCompFor()) {
      auto comp = MakeNode(NodeKind::kSetComp, line);
      comp->Add(std::move(first));
      ParseComprehensions(*comp);
      ExpectOp("}");
      return comp;
    }
    auto set = MakeNode(NodeKind::kSet, line);
    set->Add(std::move(first));
    while (AcceptOp(",")) {
      if (IsOp("}")) {
        break;
      }
      set->Add(ParseStarOrTest());
    }
    ExpectOp("}");
    return set;
  }

  // Remaining "k: v" / "**m" items up to and including the closing brace.
  void ParseDictItems(Node& dict) {
    while (!IsOp("}")) {
      if (AcceptOp("**")) {
        dict.Add(ParseBitOr());
      } else {
        dict.Add(ParseTest());
        ExpectOp(":");
        dict.Add(ParseTest());
      }
      if (!AcceptOp(",")) {
        break;
      }
    }
    ExpectOp("}");
  }

  NodePtr ParseStrings() {
    const int line = Peek().line;
    std::vector<Token> parts;
    while (Peek().kind == TokenKind::kString) {
      parts.push_back(Advance());
    }
    const bool formatted = std::any_of(parts.begin(), parts.end(), [](const Token& part) {
      return part.prefix.find('f') != std::string::npos;
    });
    if (!formatted) {
      std::string text;
      for (const auto& part : parts) {
        text += part.text;
      }
      return MakeNode(NodeKind::kConstant, line, text);
    }
    auto joined = MakeNode(NodeKind::kJoinedStr, line);
    for (const auto& part : parts) {
      if (part.prefix.find('f') != std::string::npos) {
        ParseFormatString(part, *joined);
      }
    }
    return joined;
  }

  void ParseFormatString(const Token& token, Node& joined) {
    const auto& body = token.body;
    int line = token.line;
    size_t i = 0;
    while (i < body.size()) {
      const char c = body[i];
      if (c == '{') {
        if (i + 1 < body.size() && body[i + 1] == '{') {
          i += 2;
          continue;
        }
        auto end = ParseReplacementField(body, i + 1, line, joined);
        if (end == std::string::npos) {
          return;
        }
        for (size_t k = i; k < end; ++k) {
          if (body[k] == '\n') {
            ++line;
          }
        }
        i = end;
        continue;
      }
      if (c == '}') {
        if (i + 1 < body.size() && body[i + 1] == '}') {
          i += 2;
          continue;
        }
        Unanalyzable(line);
        ++i;
        continue;
      }
      if (c == '\n') {
        ++line;
      }
      ++i;
    }
  }

  // Parses the field starting after '{'. Returns the index past the closing
  // '}', or npos when the field never closes.
  size_t ParseReplacementField(const std::string& body, size_t start, int line, Node& joined) {
    size_t j = start;
    int depth = 0;
    while (j < body.size()) {
      const char c = body[j];
      if (c == '\'' || c == '"') {
        const auto close = body.find(c, j + 1);
        if (close == std::string::npos) {
          Unanalyzable(line);
          return std::string::npos;
        }
        j = close + 1;
        continue;
      }
      if (c == '(' || c == '[' || c == '{') {
        ++depth;
      } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
        --depth;
      } else if (depth == 0) {
        if (c == '}' || c == ':') {
          break;
        }
        if (c == '!' && (j + 1 >= body.size() || body[j + 1] != '=')) {
          break;
        }
      }
      ++j;
    }
    if (j >= body.size()) {
      Unanalyzable(line);
      return std::string::npos;
    }

    std::string expression = std::string(Trim(std::string_view(body).substr(start, j - start)));
    // Self-documenting "{expr=}" form.
    if (!expression.empty() && expression.back() == '=') {
      const char before = expression.size() > 1 ? expression[expression.size() - 2] : '\0';
      if (before != '=' && before != '!' && before != '<' && before != '>') {
        expression.pop_back();
      }
    }
    AddFieldExpression(expression, line, joined);

    if (body[j] == '!') {
      while (j < body.size() && body[j] != ':' && body[j] != '}') {
        ++j;
      }
    }
    if (j < body.size() && body[j] == ':') {
      ++j;
      while (j < body.size() && body[j] != '}') {
        if (body[j] == '{') {
          auto nested_end = ParseReplacementField(body, j + 1, line, joined);
          if (nested_end == std::string::npos) {
            return std::string::npos;
          }
          j = nested_end;
          continue;
        }
        ++j;
      }
    }
    if (j >= body.size()) {
      Unanalyzable(line);
      return std::string::npos;
    }
    return j + 1;
  }

  void AddFieldExpression(const std::string& expression, int line, Node& joined) {
    if (Trim(expression).empty()) {
      Unanalyzable(line);
      return;
    }
    try {
      auto tokens = Tokenize("(" + expression + ")");
      for (auto& token : tokens) {
        token.line += line - 1;
      }
      Parser nested(std::move(tokens), warnings_);
      auto value = MakeNode(NodeKind::kFormattedValue, line);
      value->Add(nested.ParseStandaloneExpression());
      joined.Add(std::move(value));
    } catch (const SyntaxError&) {
      Unanalyzable(line);
    }
  }

  void Unanalyzable(int line) {
    warnings_.push_back("Unanalyzable f-string expression (line " + std::to_string(line) + ")");
  }

  std::vector<Token> tokens_;
  size_t pos_{0};
  std::vector<std::string>& warnings_;
};

}  // namespace

ParsedModule ParseModule(std::string_view source) {
  ParsedModule out;
  Parser parser(Tokenize(source), out.warnings);
  out.root = parser.ParseFile();
  return out;
}

}  // namespace warden::analysis
