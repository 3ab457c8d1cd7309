#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "termcalc/number.hpp"

namespace termcalc {

/// Significant digits the REPL shows by default.
inline constexpr std::size_t kDisplayDigits = 32;

/// Render `n` with at most `digits` significant digits (rounded to nearest).
///
/// Plain decimal when the decimal exponent fits within `digits`
/// ("12.34", "0.0123", "1234"), scientific otherwise ("1.2e4", "1.23e-6").
/// Trailing fractional zeros are dropped. Zero renders as "0".
/// Throws std::invalid_argument if `digits` is 0.
std::string format_number(const Number& n, std::size_t digits);

/// Byte range [first, second) of the identifier that ends at `end`, if any.
/// The identifier must start with a letter; digits may follow.
std::optional<std::pair<std::size_t, std::size_t>> ident_range(std::string_view input, std::size_t end);

/// The identifier being typed at the end of `input` (completion prefix).
std::optional<std::string_view> ident_at_end(std::string_view input);

} // namespace termcalc
