#pragma once
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "termcalc/number.hpp"
#include "termcalc/token.hpp"

namespace termcalc {

struct Expr;

/// Nodes are immutable and shared: a function body outlives the statement
/// that defined it and is reused by every call.
using ExprPtr = std::shared_ptr<const Expr>;

struct Literal {
    Number value;
};

struct Binary {
    ExprPtr lhs;
    Token op;
    ExprPtr rhs;
};

struct Unary {
    Token op;
    ExprPtr rhs;
};

struct Grouping {
    ExprPtr inner;
};

struct Var {
    std::string name;
};

struct Call {
    std::string name;
    std::vector<ExprPtr> args;
};

struct Expr {
    std::variant<Literal, Binary, Unary, Grouping, Var, Call> node;
};

template <class Node>
ExprPtr make_expr(Node node) {
    return std::make_shared<const Expr>(Expr{std::move(node)});
}

struct VarAssign {
    std::string name;
    ExprPtr value;
};

struct FuncAssign {
    std::string name;
    std::vector<std::string> params;
    ExprPtr body;
};

struct ExprStmt {
    ExprPtr expr;
};

using Stmt = std::variant<VarAssign, FuncAssign, ExprStmt>;

// Consumers dispatch with std::visit and one operator() per node type, so a
// new node kind does not compile until every visitor handles it.

/// Fully parenthesized prefix rendering, e.g. "(+ 1 (* 2 3))".
std::string to_string(const Expr& e);
std::string to_string(const Stmt& s);

} // namespace termcalc
