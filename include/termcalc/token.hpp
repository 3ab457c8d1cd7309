#pragma once
#include <cstddef>
#include <optional>

#include "termcalc/number.hpp"

namespace termcalc {

enum class TokKind {
    LParen, RParen,
    Comma,
    Dot,
    Minus, Plus, Slash, Star,
    Caret,
    Ident,
    Assign,
    Number,
    End,
    Unknown,
};

struct Token {
    TokKind kind{TokKind::End};
    std::optional<Number> literal{}; // Number only
    std::size_t start{0};            // byte span [start, end) into the source
    std::size_t end{0};

    std::size_t size() const { return end - start; }
};

const char* to_string(TokKind k);

} // namespace termcalc
