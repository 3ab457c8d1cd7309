#include "termcalc/parser.hpp"
#include "termcalc/lexer.hpp"
#include <utility>

namespace termcalc {

// -----------------------------
// Token cursor
// -----------------------------
const Token& Parser::peek() const {
    static const Token end_token{};
    if (current_ >= tokens_.size()) return tokens_.empty() ? end_token : tokens_.back();
    return tokens_[current_];
}

const Token& Parser::previous() const { return tokens_[current_ - 1]; }

bool Parser::is_at_end() const { return peek().kind == TokKind::End; }

bool Parser::check(TokKind k) const {
    if (is_at_end()) return false;
    return peek().kind == k;
}

const Token& Parser::advance() {
    if (!is_at_end()) ++current_;
    return previous();
}

bool Parser::match(TokKind k) {
    if (!check(k)) return false;
    advance();
    return true;
}

const Token& Parser::consume(TokKind k, const char* msg) {
    if (check(k)) return advance();
    fail(msg, peek());
}

std::string Parser::text(const Token& t) const {
    if (t.start > source_.size() || t.end < t.start) return {};
    return std::string(source_.substr(t.start, t.size()));
}

void Parser::fail(const std::string& msg, const Token& at) const {
    throw ParseError(msg, at.start);
}

// Counts one level of recursive descent for as long as it lives.
class Parser::Nesting {
public:
    explicit Nesting(Parser& p) : p_(p) { p_.deepen(); }
    ~Nesting() { --p_.depth_; }

    Nesting(const Nesting&) = delete;
    Nesting& operator=(const Nesting&) = delete;

private:
    Parser& p_;
};

// Every level of nesting, and every link of a + - * / ^ chain, adds one to the
// tree height the evaluator later recurses through.
void Parser::deepen() {
    if (depth_ >= max_depth_) fail("Expression nested too deeply", peek());
    ++depth_;
}

// -----------------------------
// Grammar
// -----------------------------
Stmt Parser::parse() {
    if (tokens_.empty() || tokens_.back().kind != TokKind::End) {
        std::size_t pos = tokens_.empty() ? 0 : tokens_.back().end;
        throw ParseError("Token stream is not terminated by end of input", pos);
    }
    current_ = 0;
    depth_ = 0;

    Stmt s = statement();
    if (!is_at_end()) fail("Expected end of input", peek());
    return s;
}

// An assignment target is parsed as an ordinary expression first, then
// reinterpreted: a bare variable or a call whose arguments are all bare names.
Stmt Parser::statement() {
    ExprPtr target = expression();

    if (!match(TokKind::Assign)) return ExprStmt{std::move(target)};

    const Token& equals = previous();
    ExprPtr value = expression();

    if (auto* v = std::get_if<Var>(&target->node)) return VarAssign{v->name, std::move(value)};

    if (auto* call = std::get_if<Call>(&target->node)) {
        FuncAssign f;
        f.name = call->name;
        for (const auto& arg : call->args) {
            auto* param = std::get_if<Var>(&arg->node);
            if (!param) fail("Invalid function args", equals);
            f.params.push_back(param->name);
        }
        f.body = std::move(value);
        return f;
    }

    fail("Expected function or variable assignment", equals);
}

ExprPtr Parser::expression() {
    Nesting level(*this);
    return term();
}

ExprPtr Parser::term() {
    const std::size_t depth = depth_;
    ExprPtr expr = factor();
    while (match(TokKind::Plus) || match(TokKind::Minus)) {
        deepen();
        Token op = previous();
        ExprPtr rhs = factor();
        expr = make_expr(Binary{std::move(expr), std::move(op), std::move(rhs)});
    }
    depth_ = depth;
    return expr;
}

ExprPtr Parser::factor() {
    const std::size_t depth = depth_;
    ExprPtr expr = unary();
    while (match(TokKind::Slash) || match(TokKind::Star)) {
        deepen();
        Token op = previous();
        ExprPtr rhs = unary();
        expr = make_expr(Binary{std::move(expr), std::move(op), std::move(rhs)});
    }
    depth_ = depth;
    return expr;
}

ExprPtr Parser::unary() {
    if (match(TokKind::Minus) || match(TokKind::Plus)) {
        Nesting level(*this);
        Token op = previous();
        ExprPtr rhs = unary();
        return make_expr(Unary{std::move(op), std::move(rhs)});
    }
    return exponent();
}

// Folds to the left like term/factor: 2^3^2 is (2^3)^2. The right operand
// may carry signs but does not start another '^' chain.
ExprPtr Parser::exponent() {
    const std::size_t depth = depth_;
    ExprPtr expr = primary();
    while (match(TokKind::Caret)) {
        deepen();
        Token op = previous();
        ExprPtr rhs = signed_operand();
        expr = make_expr(Binary{std::move(expr), std::move(op), std::move(rhs)});
    }
    depth_ = depth;
    return expr;
}

ExprPtr Parser::signed_operand() {
    if (match(TokKind::Minus) || match(TokKind::Plus)) {
        Nesting level(*this);
        Token op = previous();
        ExprPtr rhs = signed_operand();
        return make_expr(Unary{std::move(op), std::move(rhs)});
    }
    return primary();
}

ExprPtr Parser::primary() {
    if (match(TokKind::Number)) {
        const Token& t = previous();
        if (!t.literal) fail("Number token without a value", t);
        return make_expr(Literal{*t.literal});
    }

    if (match(TokKind::LParen)) {
        ExprPtr inner = expression();
        consume(TokKind::RParen, "Expect ')' after expression.");
        return make_expr(Grouping{std::move(inner)});
    }

    if (match(TokKind::Ident)) {
        std::string name = text(previous());
        if (!match(TokKind::LParen)) return make_expr(Var{std::move(name)});

        Call call;
        call.name = std::move(name);
        do {
            call.args.push_back(expression());
        } while (match(TokKind::Comma));
        consume(TokKind::RParen, "Expect ')' after function call.");
        return make_expr(std::move(call));
    }

    const Token& t = peek();
    if (t.kind == TokKind::Unknown) fail("Unexpected character '" + text(t) + "'", t);
    fail("Expected expression", t);
}

Stmt parse(const std::vector<Token>& tokens, std::string_view source) {
    return Parser(tokens, source).parse();
}

Stmt parse(std::string_view source) {
    std::vector<Token> tokens = scan(source);
    return Parser(tokens, source).parse();
}

std::string describe(const ParseError& e, std::string_view source) {
    std::string out(source);
    out += '\n';
    out.append(e.position(), ' ');
    out += "^ ";
    out += e.what();
    return out;
}

} // namespace termcalc
