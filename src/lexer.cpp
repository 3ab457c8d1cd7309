#include "termcalc/lexer.hpp"
#include <cctype>

namespace termcalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}
static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}
static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

const char* to_string(TokKind k) {
    switch (k) {
        case TokKind::LParen:  return "'('";
        case TokKind::RParen:  return "')'";
        case TokKind::Comma:   return "','";
        case TokKind::Dot:     return "'.'";
        case TokKind::Minus:   return "'-'";
        case TokKind::Plus:    return "'+'";
        case TokKind::Slash:   return "'/'";
        case TokKind::Star:    return "'*'";
        case TokKind::Caret:   return "'^'";
        case TokKind::Ident:   return "identifier";
        case TokKind::Assign:  return "'='";
        case TokKind::Number:  return "number";
        case TokKind::End:     return "end of input";
        case TokKind::Unknown: return "unknown";
    }
    return "unknown";
}

std::vector<Token> Lexer::scan() {
    tokens_.clear();
    i_ = 0;
    while (!is_end()) {
        start_ = i_;
        scan_token();
    }
    start_ = i_;
    add(TokKind::End);
    return std::move(tokens_);
}

void Lexer::add(TokKind kind) {
    Token t;
    t.kind = kind;
    t.start = start_;
    t.end = i_;
    tokens_.push_back(std::move(t));
}

void Lexer::scan_token() {
    char c = s_[i_++];

    switch (c) {
        case '(': add(TokKind::LParen); return;
        case ')': add(TokKind::RParen); return;
        case ',': add(TokKind::Comma); return;
        case '.': add(TokKind::Dot); return;
        case '-': add(TokKind::Minus); return;
        case '+': add(TokKind::Plus); return;
        case '/': add(TokKind::Slash); return;
        case '*': add(TokKind::Star); return;
        case '=': add(TokKind::Assign); return;
        case '^': add(TokKind::Caret); return;
        case ' ': return;
        default: break;
    }

    if (is_digit(c)) {
        number();
        return;
    }
    if (is_ident_start(c)) {
        identifier();
        return;
    }
    // Rejected later by the parser, and only if it needs a token here.
    add(TokKind::Unknown);
}

void Lexer::number() {
    while (is_digit(peek())) ++i_;
    // "1." and "1.x" leave the dot as its own token
    if (peek() == '.' && is_digit(peek(1))) {
        ++i_;
        while (is_digit(peek())) ++i_;
    }

    Token t;
    t.kind = TokKind::Number;
    t.literal = parse_number(s_.substr(start_, i_ - start_));
    t.start = start_;
    t.end = i_;
    tokens_.push_back(std::move(t));
}

void Lexer::identifier() {
    while (is_ident_char(peek())) ++i_;
    add(TokKind::Ident);
}

std::vector<Token> scan(std::string_view source) {
    return Lexer(source).scan();
}

} // namespace termcalc
