#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "warden/analysis/ast.h"
#include "warden/analysis/tokenizer.h"

namespace warden::analysis {

struct ParsedModule {
  NodePtr root;
  // Non-fatal findings such as f-string replacement fields that do not parse.
  std::vector<std::string> warnings;
};

// Recursive-descent parser for the Python 3 statement and expression grammar.
// Throws SyntaxError on malformed input.
ParsedModule ParseModule(std::string_view source);

}  // namespace warden::analysis
