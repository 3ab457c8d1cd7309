#pragma once
#include <string_view>

#include <boost/multiprecision/cpp_bin_float.hpp>

namespace termcalc {

/// Mantissa width of every value the calculator computes with.
inline constexpr unsigned kPrecisionBits = 256;

using Number = boost::multiprecision::number<
    boost::multiprecision::cpp_bin_float<kPrecisionBits, boost::multiprecision::digit_base_2>,
    boost::multiprecision::et_off>;

/// Parse a decimal literal ("12", "0.5"). Rounds to nearest.
Number parse_number(std::string_view text);

} // namespace termcalc
