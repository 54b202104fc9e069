#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tether::sandbox {

enum class token_kind {
  name,
  number,
  string,
  fstring,
  op,
  newline,
  indent,
  dedent,
  end,
};

struct token {
  token_kind kind;
  std::string text;
  int line{0};
};

/// Tokenise with Python's layout rules: INDENT/DEDENT from leading
/// whitespace, implicit line joining inside brackets, backslash
/// continuation.  String tokens carry their decoded value; f-strings keep
/// their raw body for the parser.  Throws syntax_error.
std::vector<token> tokenize(std::string_view source);

}  // namespace tether::sandbox
