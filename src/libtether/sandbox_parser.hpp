#pragma once

#include <string_view>

#include "sandbox_ast.hpp"

namespace tether::sandbox {

/// Parse a whole program.  Throws syntax_error, or sandbox_violation for
/// constructs that are never allowed (import, def, class, lambda, ...).
block parse_program(std::string_view source);

/// Reject forbidden names and dunder attributes anywhere in @p program.
/// Throws sandbox_violation.
void validate(const block& program);

/// True for builtins that sandboxed code may never name.
bool is_forbidden_name(std::string_view id);

}  // namespace tether::sandbox
