#include "termcalc/interpreter.hpp"
#include "termcalc/builtins.hpp"
#include "termcalc/parser.hpp"
#include <exception>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace termcalc {

// -----------------------------
// Expressions
// -----------------------------
Number Interpreter::eval(const Expr& e) {
    return std::visit(*this, e.node);
}

Number Interpreter::operator()(const Literal& e) { return e.value; }

Number Interpreter::operator()(const Grouping& e) { return eval(*e.inner); }

Number Interpreter::operator()(const Var& e) {
    if (e.name == "ans") return ans_;

    // Only the innermost call is visible; outer calls' parameters are not.
    if (!frames_.empty()) {
        const Frame& top = frames_.back();
        auto it = top.find(e.name);
        if (it != top.end()) return it->second;
    }

    if (const Number* v = env_.get_variable(e.name)) return *v;
    throw EvalError(fmt::format("Undeclared variable '{}'", e.name));
}

// Library failures (domain, convergence) surface as evaluation errors.
static Number power(const Number& base, const Number& exp) {
    try {
        return boost::multiprecision::pow(base, exp);
    } catch (const std::exception& ex) {
        throw EvalError(fmt::format("Arithmetic error: {}", ex.what()));
    }
}

Number Interpreter::operator()(const Binary& e) {
    Number lhs = eval(*e.lhs);
    Number rhs = eval(*e.rhs);
    switch (e.op.kind) {
        case TokKind::Plus:  return lhs + rhs;
        case TokKind::Minus: return lhs - rhs;
        case TokKind::Slash: return lhs / rhs;
        case TokKind::Star:  return lhs * rhs;
        case TokKind::Caret: return power(lhs, rhs);
        default: break;
    }
    throw EvalError(fmt::format("Unsupported binary operator {}", to_string(e.op.kind)));
}

Number Interpreter::operator()(const Unary& e) {
    Number rhs = eval(*e.rhs);
    switch (e.op.kind) {
        case TokKind::Minus: return -rhs;
        case TokKind::Plus:  return rhs;
        default: break;
    }
    throw EvalError(fmt::format("Unsupported unary operator {}", to_string(e.op.kind)));
}

Number Interpreter::operator()(const Call& e) {
    // Arguments are evaluated in the caller's frame, before anything is resolved.
    std::vector<Number> args;
    args.reserve(e.args.size());
    for (const auto& a : e.args) args.push_back(eval(*a));

    const Function* f = env_.get_function(e.name);
    if (!f) throw EvalError(fmt::format("No function named '{}'", e.name));

    if (auto* native = std::get_if<BuiltinFn>(f)) return (*native)(args);

    // Copy: the body may redefine this very name and invalidate `f`.
    UserFunction user = std::get<UserFunction>(*f);
    return call_user(e.name, user, std::move(args));
}

Number Interpreter::call_user(const std::string& name, const UserFunction& f, std::vector<Number> args) {
    if (args.size() != f.params.size())
        throw EvalError(fmt::format("Function '{}' takes {} args", name, f.params.size()));
    if (frames_.size() >= opts_.max_call_depth)
        throw EvalError(fmt::format("Maximum call depth of {} exceeded", opts_.max_call_depth));

    Frame frame;
    for (std::size_t i = 0; i < f.params.size(); ++i)
        frame.insert_or_assign(f.params[i], std::move(args[i]));

    // Popped on every way out of the call, errors included.
    struct PopFrame {
        std::vector<Frame>& frames;
        ~PopFrame() { frames.pop_back(); }
    };
    frames_.push_back(std::move(frame));
    PopFrame pop{frames_};
    return eval(*f.body);
}

// -----------------------------
// Statements
// -----------------------------
Number Interpreter::execute(const Stmt& s) {
    return std::visit(*this, s);
}

Number Interpreter::operator()(const VarAssign& s) {
    Number value = eval(*s.value);
    if (persist_) env_.set_variable(s.name, value);
    return value;
}

// The body is not evaluated until the function is called.
Number Interpreter::operator()(const FuncAssign& s) {
    if (persist_) env_.set_function(s.name, UserFunction{s.params, s.body});
    return Number(1);
}

Number Interpreter::operator()(const ExprStmt& s) { return eval(*s.expr); }

Number evaluate(const Stmt& s, Environment& env, const Number& last_answer, bool persist, EvalOptions opts) {
    Interpreter it(env, last_answer, persist, opts);
    return it.execute(s);
}

// -----------------------------
// Session
// -----------------------------
Session::Session(EvalOptions opts) : opts_(opts) {
    builtins::install(env_);
}

Number Session::submit(std::string_view input) {
    Stmt s = parse(input);
    Number result = evaluate(s, env_, ans_, true, opts_);
    ans_ = result;
    return result;
}

Number Session::preview(std::string_view input) {
    Stmt s = parse(input);
    return evaluate(s, env_, ans_, false, opts_);
}

} // namespace termcalc
