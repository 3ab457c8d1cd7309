#pragma once
#include <string_view>
#include <vector>

#include "termcalc/token.hpp"

namespace termcalc {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Scan the whole input. Never throws on bad characters: they become
    /// TokKind::Unknown tokens. The result always ends with TokKind::End.
    std::vector<Token> scan();

private:
    void scan_token();
    void number();
    void identifier();
    void add(TokKind kind);

    bool is_end() const { return i_ >= s_.size(); }
    char peek(std::size_t offset = 0) const {
        return i_ + offset < s_.size() ? s_[i_ + offset] : '\0';
    }

    std::string_view s_;
    std::size_t start_{0};
    std::size_t i_{0};
    std::vector<Token> tokens_;
};

/// Convenience wrapper around Lexer::scan().
std::vector<Token> scan(std::string_view source);

} // namespace termcalc
