#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "warden/error.h"

namespace warden::analysis {

enum class TokenKind { kName, kNumber, kString, kOp, kNewline, kIndent, kDedent, kEndMarker };

struct Token {
  TokenKind kind{TokenKind::kEndMarker};
  // Full source text of the token; for strings this includes prefix and quotes.
  std::string text;
  int line{0};
  int column{0};
  // Strings only: lower-cased prefix and the raw text between the quotes.
  std::string prefix;
  std::string body;
};

// Raised by the tokenizer and parser; line is 1-based.
struct SyntaxError : public Error {
  int line;
  SyntaxError(std::string msg, int at_line)
      : Error(ErrorDomain::Validation, errors::validation::kSyntaxError, std::move(msg)),
        line(at_line) {}
};

// Produces the logical token stream of Python 3 source: implicit line joining
// inside brackets, backslash continuation, INDENT/DEDENT from leading
// whitespace (tabs advance to the next multiple of eight).
std::vector<Token> Tokenize(std::string_view source);

bool IsKeyword(std::string_view word);

}  // namespace warden::analysis
