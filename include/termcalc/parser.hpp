#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "termcalc/ast.hpp"
#include "termcalc/token.hpp"

namespace termcalc {

struct ParseError : std::runtime_error {
    ParseError(const std::string& msg, std::size_t position)
        : std::runtime_error(msg), position_(position) {}

    /// Byte offset of the token the parser stopped at.
    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

/// Expression tree height allowed before parsing gives up: nested parentheses,
/// call arguments and signs, plus operator chains like 1+1+...+1.
inline constexpr std::size_t kMaxParseDepth = 512;

class Parser {
public:
    Parser(const std::vector<Token>& tokens, std::string_view source, std::size_t max_depth = kMaxParseDepth)
        : tokens_(tokens), source_(source), max_depth_(max_depth) {}

    /// Parse exactly one statement spanning the whole token sequence.
    /// The sequence must end with a TokKind::End token.
    /// Throws ParseError on malformed input.
    Stmt parse();

private:
    Stmt statement();
    ExprPtr expression();
    ExprPtr term();
    ExprPtr factor();
    ExprPtr unary();
    ExprPtr exponent();
    ExprPtr signed_operand();
    ExprPtr primary();

    class Nesting;

    void deepen();
    bool match(TokKind k);
    bool check(TokKind k) const;
    const Token& advance();
    const Token& consume(TokKind k, const char* msg);
    const Token& peek() const;
    const Token& previous() const;
    bool is_at_end() const;
    std::string text(const Token& t) const;
    [[noreturn]] void fail(const std::string& msg, const Token& at) const;

    const std::vector<Token>& tokens_;
    std::string_view source_;
    std::size_t max_depth_;
    std::size_t current_{0};
    std::size_t depth_{0};
};

/// Parse a scanned statement; `source` is the text the tokens were scanned from.
Stmt parse(const std::vector<Token>& tokens, std::string_view source);

/// Scan + parse.
Stmt parse(std::string_view source);

/// Render `source` with a caret under the error position:
///   1 + * 2
///       ^ Expected expression
std::string describe(const ParseError& e, std::string_view source);

} // namespace termcalc
