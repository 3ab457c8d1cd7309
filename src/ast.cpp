#include "termcalc/ast.hpp"
#include "termcalc/format.hpp"

namespace termcalc {

static const char* op_symbol(TokKind k) {
    switch (k) {
        case TokKind::Plus:  return "+";
        case TokKind::Minus: return "-";
        case TokKind::Star:  return "*";
        case TokKind::Slash: return "/";
        case TokKind::Caret: return "^";
        default:             return "?";
    }
}

namespace {

struct Printer {
    std::string operator()(const Literal& e) const { return format_number(e.value, kDisplayDigits); }
    std::string operator()(const Var& e) const { return e.name; }

    std::string operator()(const Grouping& e) const {
        return "(group " + to_string(*e.inner) + ")";
    }

    std::string operator()(const Binary& e) const {
        return std::string("(") + op_symbol(e.op.kind) + " " + to_string(*e.lhs) + " " + to_string(*e.rhs) + ")";
    }

    std::string operator()(const Unary& e) const {
        return std::string("(") + op_symbol(e.op.kind) + " " + to_string(*e.rhs) + ")";
    }

    std::string operator()(const Call& e) const {
        std::string s = "(" + e.name;
        for (const auto& a : e.args) s += " " + to_string(*a);
        return s + ")";
    }

    std::string operator()(const VarAssign& s) const { return s.name + " = " + to_string(*s.value); }

    std::string operator()(const FuncAssign& s) const {
        std::string head = "(" + s.name;
        for (const auto& p : s.params) head += " " + p;
        return head + ") = " + to_string(*s.body);
    }

    std::string operator()(const ExprStmt& s) const { return to_string(*s.expr); }
};

} // namespace

std::string to_string(const Expr& e) { return std::visit(Printer{}, e.node); }

std::string to_string(const Stmt& s) { return std::visit(Printer{}, s); }

} // namespace termcalc
