#include "warden/analysis/tokenizer.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace warden::analysis {

namespace {

constexpr std::array<std::string_view, 35> kKeywords = {
    "False", "None",   "True",    "and",      "as",       "assert", "async",  "await", "break",
    "class", "continue", "def",   "del",      "elif",     "else",   "except", "finally", "for",
    "from",  "global", "if",      "import",   "in",       "is",     "lambda", "nonlocal", "not",
    "or",    "pass",   "raise",   "return",   "try",      "while",  "with",   "yield"};

// Longest first so that a prefix never shadows a longer operator.
constexpr std::array<std::string_view, 48> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", "<<", ">>", "<=",
    ">=",  "==",  "!=",  "+=",  "-=",  "*=", "/=", "%=", "&=", "|=", "^=", "@=",
    "+",   "-",   "*",   "/",   "%",   "@",  "&",  "|",  "^",  "~",  "<",  ">",
    "(",   ")",   "[",   "]",   "{",   "}",  ",",  ":",  ".",  ";",  "=",  "!"};

bool IsNameStart(unsigned char c) { return std::isalpha(c) != 0 || c == '_' || c >= 0x80; }
bool IsNameChar(unsigned char c) { return IsNameStart(c) || std::isdigit(c) != 0; }

bool IsStringPrefix(std::string_view word) {
  std::string lower(word);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "br" ||
         lower == "rb" || lower == "fr" || lower == "rf";
}

std::string Normalize(std::string_view source) {
  if (source.substr(0, 3) == "\xEF\xBB\xBF") {
    source.remove_prefix(3);
  }
  std::string out;
  out.reserve(source.size() + 1);
  for (size_t i = 0; i < source.size(); ++i) {
    if (source[i] == '\r') {
      out.push_back('\n');
      if (i + 1 < source.size() && source[i + 1] == '\n') {
        ++i;
      }
      continue;
    }
    out.push_back(source[i]);
  }
  return out;
}

class Lexer {
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  std::vector<Token> Run() {
    while (true) {
      if (at_line_start_ && brackets_.empty()) {
        if (!StartLogicalLine()) {
          break;
        }
      }
      if (pos_ >= src_.size()) {
        break;
      }
      const char c = src_[pos_];
      if (c == ' ' || c == '\t' || c == '\f') {
        ++pos_;
        continue;
      }
      if (c == '#') {
        SkipComment();
        continue;
      }
      if (c == '\n') {
        if (brackets_.empty()) {
          Emit(TokenKind::kNewline, "\n", pos_);
          at_line_start_ = true;
        }
        ++pos_;
        NextLine();
        continue;
      }
      if (c == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
          pos_ += 2;
          NextLine();
          continue;
        }
        throw SyntaxError("unexpected character after line continuation character", line_);
      }
      const auto uc = static_cast<unsigned char>(c);
      if (std::isdigit(uc) != 0 ||
          (c == '.' && pos_ + 1 < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])) != 0)) {
        ReadNumber();
        continue;
      }
      if (IsNameStart(uc)) {
        ReadNameOrString();
        continue;
      }
      if (c == '"' || c == '\'') {
        ReadString(pos_, "");
        continue;
      }
      ReadOperator();
    }
    Finish();
    return std::move(tokens_);
  }

private:
  // Consumes indentation, blank and comment-only lines. Returns false at EOF.
  bool StartLogicalLine() {
    while (pos_ < src_.size()) {
      int column = 0;
      size_t p = pos_;
      while (p < src_.size()) {
        if (src_[p] == ' ') {
          ++column;
        } else if (src_[p] == '\t') {
          column = (column / 8 + 1) * 8;
        } else if (src_[p] == '\f') {
          column = 0;
        } else {
          break;
        }
        ++p;
      }
      if (p >= src_.size()) {
        pos_ = p;
        return false;
      }
      if (src_[p] == '#' || src_[p] == '\n') {
        pos_ = p;
        SkipComment();
        if (pos_ < src_.size()) {
          ++pos_;
          NextLine();
        }
        continue;
      }
      pos_ = p;
      at_line_start_ = false;
      if (column > indents_.back()) {
        indents_.push_back(column);
        Emit(TokenKind::kIndent, "", pos_);
      } else {
        while (column < indents_.back()) {
          indents_.pop_back();
          Emit(TokenKind::kDedent, "", pos_);
        }
        if (column != indents_.back()) {
          throw SyntaxError("unindent does not match any outer indentation level", line_);
        }
      }
      return true;
    }
    return false;
  }

  void SkipComment() {
    while (pos_ < src_.size() && src_[pos_] != '\n') {
      ++pos_;
    }
  }

  void NextLine() {
    ++line_;
    line_start_ = pos_;
  }

  void Emit(TokenKind kind, std::string text, size_t at) {
    Token token;
    token.kind = kind;
    token.text = std::move(text);
    token.line = line_;
    token.column = static_cast<int>(at - std::min(at, line_start_));
    tokens_.push_back(std::move(token));
  }

  void ReadNumber() {
    const size_t start = pos_;
    auto digits = [this](auto pred) {
      while (pos_ < src_.size() && (pred(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
        ++pos_;
      }
    };
    auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (src_[pos_] == '0' && pos_ + 1 < src_.size() &&
        std::string_view("xXoObB").find(src_[pos_ + 1]) != std::string_view::npos) {
      pos_ += 2;
      digits([](unsigned char c) { return std::isxdigit(c) != 0; });
    } else {
      digits(is_digit);
      if (pos_ < src_.size() && src_[pos_] == '.') {
        ++pos_;
        digits(is_digit);
      }
      if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
        size_t p = pos_ + 1;
        if (p < src_.size() && (src_[p] == '+' || src_[p] == '-')) {
          ++p;
        }
        if (p < src_.size() && std::isdigit(static_cast<unsigned char>(src_[p])) != 0) {
          pos_ = p;
          digits(is_digit);
        }
      }
      if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
        ++pos_;
      }
    }
    Emit(TokenKind::kNumber, std::string(src_.substr(start, pos_ - start)), start);
  }

  void ReadNameOrString() {
    const size_t start = pos_;
    while (pos_ < src_.size() && IsNameChar(static_cast<unsigned char>(src_[pos_]))) {
      ++pos_;
    }
    auto word = src_.substr(start, pos_ - start);
    if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && IsStringPrefix(word)) {
      ReadString(start, word);
      return;
    }
    Emit(TokenKind::kName, std::string(word), start);
  }

  void ReadString(size_t start, std::string_view prefix) {
    const int start_line = line_;
    const size_t start_line_offset = line_start_;
    const char quote = src_[pos_];
    const bool triple = src_.substr(pos_, 3) == std::string(3, quote);
    pos_ += triple ? 3 : 1;
    const size_t body_start = pos_;
    size_t body_end = 0;
    while (true) {
      if (pos_ >= src_.size()) {
        throw SyntaxError(std::string(triple ? "unterminated triple-quoted string literal"
                                             : "unterminated string literal") +
                              " (detected at line " + std::to_string(line_) + ")",
                          start_line);
      }
      const char ch = src_[pos_];
      if (ch == '\\') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
          pos_ += 2;
          NextLine();
        } else {
          pos_ += 2;
        }
        continue;
      }
      if (ch == '\n') {
        if (!triple) {
          throw SyntaxError("unterminated string literal (detected at line " + std::to_string(line_) + ")",
                            start_line);
        }
        ++pos_;
        NextLine();
        continue;
      }
      if (ch == quote) {
        if (!triple) {
          body_end = pos_;
          ++pos_;
          break;
        }
        if (src_.substr(pos_, 3) == std::string(3, quote)) {
          body_end = pos_;
          pos_ += 3;
          break;
        }
      }
      ++pos_;
    }
    Token token;
    token.kind = TokenKind::kString;
    token.text = std::string(src_.substr(start, pos_ - start));
    token.line = start_line;
    token.column = static_cast<int>(start - start_line_offset);
    token.prefix.reserve(prefix.size());
    for (char p : prefix) {
      token.prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(p))));
    }
    token.body = std::string(src_.substr(body_start, body_end - body_start));
    tokens_.push_back(std::move(token));
  }

  void ReadOperator() {
    for (auto op : kOperators) {
      if (src_.substr(pos_, op.size()) != op) {
        continue;
      }
      if (op == "!") {
        throw SyntaxError("invalid syntax", line_);
      }
      TrackBracket(op);
      Emit(TokenKind::kOp, std::string(op), pos_);
      pos_ += op.size();
      return;
    }
    throw SyntaxError(std::string("invalid character '") + src_[pos_] + "'", line_);
  }

  void TrackBracket(std::string_view op) {
    const char c = op.front();
    if (op.size() != 1) {
      return;
    }
    if (c == '(' || c == '[' || c == '{') {
      brackets_.emplace_back(c, line_);
      return;
    }
    if (c != ')' && c != ']' && c != '}') {
      return;
    }
    if (brackets_.empty()) {
      throw SyntaxError(std::string("unmatched '") + c + "'", line_);
    }
    const char open = brackets_.back().first;
    const bool matches = (open == '(' && c == ')') || (open == '[' && c == ']') || (open == '{' && c == '}');
    if (!matches) {
      throw SyntaxError(std::string("closing parenthesis '") + c +
                            "' does not match opening parenthesis '" + open + "'",
                        line_);
    }
    brackets_.pop_back();
  }

  void Finish() {
    if (!brackets_.empty()) {
      throw SyntaxError(std::string("'") + brackets_.back().first + "' was never closed",
                        brackets_.back().second);
    }
    if (!tokens_.empty() && tokens_.back().kind != TokenKind::kNewline &&
        tokens_.back().kind != TokenKind::kDedent) {
      Emit(TokenKind::kNewline, "", pos_);
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      Emit(TokenKind::kDedent, "", pos_);
    }
    Emit(TokenKind::kEndMarker, "", pos_);
  }

  std::string_view src_;
  size_t pos_{0};
  int line_{1};
  size_t line_start_{0};
  bool at_line_start_{true};
  std::vector<int> indents_{0};
  std::vector<std::pair<char, int>> brackets_;
  std::vector<Token> tokens_;
};

}  // namespace

bool IsKeyword(std::string_view word) {
  return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

std::vector<Token> Tokenize(std::string_view source) {
  const auto normalized = Normalize(source);
  Lexer lexer(normalized);
  return lexer.Run();
}

}  // namespace warden::analysis
