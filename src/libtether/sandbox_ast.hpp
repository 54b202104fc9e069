#pragma once

#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tether::sandbox {

namespace json = boost::json;

enum class unary_op { plus, minus, logical_not };

enum class binary_op { add, sub, mul, div, floor_div, mod, pow };

enum class compare_op { eq, ne, lt, le, gt, ge, in, not_in, is, is_not };

struct expr;
using expr_ptr = std::shared_ptr<expr>;

struct comp_clause {
  expr_ptr target;
  expr_ptr iter;
  std::vector<expr_ptr> conditions;
};

struct expr {
  struct constant {
    json::value value;
  };

  struct name {
    std::string id;
  };

  /// f"..." pieces: literal text or a replacement field
  struct format_field {
    expr_ptr value;
    char conversion{0};
    std::string spec;
  };
  struct fstring {
    std::vector<std::variant<std::string, format_field>> parts;
  };

  struct list {
    std::vector<expr_ptr> elements;
  };

  struct tuple {
    std::vector<expr_ptr> elements;
  };

  struct dict {
    std::vector<std::pair<expr_ptr, expr_ptr>> items;
  };

  struct unary {
    unary_op op;
    expr_ptr operand;
  };

  struct binary {
    binary_op op;
    expr_ptr lhs;
    expr_ptr rhs;
  };

  /// Short-circuit and/or
  struct logical {
    bool is_and;
    expr_ptr lhs;
    expr_ptr rhs;
  };

  struct compare {
    expr_ptr first;
    std::vector<std::pair<compare_op, expr_ptr>> rest;
  };

  struct conditional {
    expr_ptr test;
    expr_ptr body;
    expr_ptr orelse;
  };

  struct attribute {
    expr_ptr object;
    std::string name;
  };

  struct subscript {
    expr_ptr object;
    expr_ptr index;
  };

  struct slice {
    expr_ptr lower;
    expr_ptr upper;
    expr_ptr step;
  };

  struct call {
    expr_ptr func;
    std::vector<expr_ptr> args;
    std::vector<std::pair<std::string, expr_ptr>> keywords;
  };

  /// List comprehension, or dict comprehension when @c key is set
  struct comprehension {
    expr_ptr key;
    expr_ptr element;
    std::vector<comp_clause> clauses;
  };

  int line{0};
  std::variant<
      constant, name, fstring, list, tuple, dict, unary, binary, logical,
      compare, conditional, attribute, subscript, slice, call, comprehension>
      node;
};

struct stmt;
using stmt_ptr = std::shared_ptr<stmt>;
using block = std::vector<stmt_ptr>;

struct stmt {
  struct expression {
    expr_ptr value;
  };

  /// a = b = value
  struct assign {
    std::vector<expr_ptr> targets;
    expr_ptr value;
  };

  struct aug_assign {
    expr_ptr target;
    binary_op op;
    expr_ptr value;
  };

  struct if_else {
    std::vector<std::pair<expr_ptr, block>> branches;
    block orelse;
  };

  struct while_loop {
    expr_ptr test;
    block body;
  };

  struct for_loop {
    expr_ptr target;
    expr_ptr iter;
    block body;
  };

  /// except [type_name [as binding]]
  struct handler {
    std::optional<std::string> type_name;
    std::optional<std::string> binding;
    block body;
  };
  struct try_except {
    block body;
    std::vector<handler> handlers;
  };

  struct pass {};
  struct brk {};
  struct cont {};

  int line{0};
  std::variant<
      expression, assign, aug_assign, if_else, while_loop, for_loop,
      try_except, pass, brk, cont>
      node;
};

template <typename Node>
expr_ptr make_expr(int line, Node node) {
  auto e = std::make_shared<expr>();
  e->line = line;
  e->node = std::move(node);
  return e;
}

template <typename Node>
stmt_ptr make_stmt(int line, Node node) {
  auto s = std::make_shared<stmt>();
  s->line = line;
  s->node = std::move(node);
  return s;
}

}  // namespace tether::sandbox
