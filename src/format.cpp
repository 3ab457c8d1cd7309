#include "termcalc/format.hpp"
#include <cctype>
#include <cstdlib>
#include <ios>
#include <stdexcept>

namespace termcalc {

// -----------------------------
// Number formatting
// -----------------------------

// Value == (negative ? -1 : 1) * 0.<digits> * 10^exp, digits.size() == requested count.
struct Decimal {
    bool negative{false};
    std::string digits;
    long exp{0};
};

static Decimal split_scientific(const std::string& s, std::size_t count) {
    // s looks like "-1.2340e+03"
    Decimal d;
    std::size_t i = 0;
    if (i < s.size() && s[i] == '-') {
        d.negative = true;
        ++i;
    }
    for (; i < s.size() && s[i] != 'e'; ++i) {
        if (std::isdigit(static_cast<unsigned char>(s[i]))) d.digits += s[i];
    }
    if (i < s.size()) d.exp = std::strtol(s.c_str() + i + 1, nullptr, 10) + 1;
    d.digits.resize(count, '0');
    return d;
}

static Decimal decompose(const Number& n, std::size_t count) {
    if (count > 1) {
        return split_scientific(n.str(static_cast<std::streamsize>(count - 1), std::ios_base::scientific), count);
    }

    // str() reads a precision of 0 as "every digit", so round the single digit
    // here, halves to even like str() does.
    Decimal d = split_scientific(n.str(1, std::ios_base::scientific), 2);
    long e = d.exp - 1;
    // Scale by an exact power of ten so decimal halves (0.25) stay exact.
    Number m = boost::multiprecision::abs(n);
    if (e < 0)
        m *= boost::multiprecision::pow(Number(10), Number(-e));
    else
        m /= boost::multiprecision::pow(Number(10), Number(e));

    Number r = boost::multiprecision::floor(m);
    Number frac = m - r;
    if (frac > Number(0.5) || (frac == Number(0.5) && r.convert_to<int>() % 2 != 0)) r += 1;
    if (r >= 10) {
        r = 1;
        ++e;
    } else if (r < 1) {
        r = 1;
    }
    d.digits = std::to_string(r.convert_to<int>());
    d.exp = e + 1;
    return d;
}

static std::string trim_trailing_zeros(std::string s) {
    std::size_t last = s.find_last_not_of('0');
    s.erase(last == std::string::npos ? 0 : last + 1);
    return s;
}

// "12340", 2 -> "12.34"; "1200", 2 -> "12"
static std::string insert_point(const std::string& digits, std::size_t at) {
    std::string head = digits.substr(0, at);
    std::string tail = trim_trailing_zeros(digits.substr(at));
    if (tail.empty()) return head;
    return head + "." + tail;
}

std::string format_number(const Number& n, std::size_t digits) {
    if (digits == 0) throw std::invalid_argument("format_number: digits must be positive");

    if (boost::multiprecision::isnan(n)) return "NaN";
    if (boost::multiprecision::isinf(n)) return n < 0 ? "-inf" : "inf";
    if (n == 0) return "0";

    Decimal d = decompose(n, digits);
    const long width = static_cast<long>(digits);

    std::string out;
    if (0 < d.exp && d.exp < width) {
        out = insert_point(d.digits, static_cast<std::size_t>(d.exp));
    } else if (d.exp == width) {
        out = d.digits;
    } else if (-width < d.exp && d.exp <= 0) {
        out = "0." + std::string(static_cast<std::size_t>(-d.exp), '0') + trim_trailing_zeros(d.digits);
    } else {
        out = insert_point(d.digits, 1) + "e" + std::to_string(d.exp - 1);
    }

    if (d.negative) out.insert(out.begin(), '-');
    return out;
}

// -----------------------------
// Identifier helpers
// -----------------------------
std::optional<std::pair<std::size_t, std::size_t>> ident_range(std::string_view input, std::size_t end) {
    if (end > input.size()) end = input.size();

    std::optional<std::size_t> first;
    for (std::size_t i = end; i > 0; --i) {
        unsigned char c = static_cast<unsigned char>(input[i - 1]);
        if (std::isalpha(c)) first = i - 1;
        if (!std::isalnum(c)) break;
    }
    if (!first) return std::nullopt;
    return std::make_pair(*first, end);
}

std::optional<std::string_view> ident_at_end(std::string_view input) {
    auto r = ident_range(input, input.size());
    if (!r) return std::nullopt;
    return input.substr(r->first, r->second - r->first);
}

} // namespace termcalc
