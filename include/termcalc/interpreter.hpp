#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "termcalc/ast.hpp"
#include "termcalc/env.hpp"
#include "termcalc/number.hpp"

namespace termcalc {

struct EvalError : std::runtime_error { using std::runtime_error::runtime_error; };

struct EvalOptions {
    /// Nested user-function calls allowed before evaluation gives up.
    std::size_t max_call_depth{256};
};

/// Tree-walking evaluator for one statement.
///
/// Variables resolve as: `ans`, then the innermost call frame, then `env`.
/// Functions always resolve from `env`. With `persist` false, assignments are
/// evaluated but nothing is written to `env`.
/// Throws EvalError on unknown names, arity mismatches, bad built-in input
/// and call depth overflow.
class Interpreter {
public:
    Interpreter(Environment& env, const Number& last_answer, bool persist, EvalOptions opts = {})
        : env_(env), ans_(last_answer), persist_(persist), opts_(opts) {}

    Number execute(const Stmt& s);
    Number eval(const Expr& e);

    Number operator()(const Literal& e);
    Number operator()(const Binary& e);
    Number operator()(const Unary& e);
    Number operator()(const Grouping& e);
    Number operator()(const Var& e);
    Number operator()(const Call& e);

    Number operator()(const VarAssign& s);
    Number operator()(const FuncAssign& s);
    Number operator()(const ExprStmt& s);

private:
    using Frame = std::map<std::string, Number, std::less<>>;

    Number call_user(const std::string& name, const UserFunction& f, std::vector<Number> args);

    Environment& env_;
    const Number& ans_;
    bool persist_;
    EvalOptions opts_;
    std::vector<Frame> frames_;
};

/// Evaluate `s` against `env`. See Interpreter.
Number evaluate(const Stmt& s, Environment& env, const Number& last_answer, bool persist, EvalOptions opts = {});

/// A calculator session: environment with built-ins, the `ans` register and options.
class Session {
public:
    explicit Session(EvalOptions opts = {});

    /// Scan, parse and evaluate `input`, keeping assignments and updating `ans`.
    /// Throws ParseError / EvalError; on error nothing changes.
    Number submit(std::string_view input);

    /// Like submit() but leaves the environment and `ans` untouched.
    Number preview(std::string_view input);

    Environment& env() { return env_; }
    const Environment& env() const { return env_; }
    const Number& last_answer() const { return ans_; }

private:
    Environment env_;
    Number ans_{0};
    EvalOptions opts_;
};

} // namespace termcalc
