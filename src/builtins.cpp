#include "termcalc/builtins.hpp"
#include "termcalc/interpreter.hpp"
#include <algorithm>

#include <fmt/format.h>

namespace termcalc::builtins {

static void require_args(const char* name, const std::vector<Number>& args) {
    if (args.empty()) throw EvalError(fmt::format("Function '{}' needs at least 1 argument", name));
}

Number sum(const std::vector<Number>& args) {
    Number acc = 0;
    for (const auto& a : args) acc += a;
    return acc;
}

Number avg(const std::vector<Number>& args) {
    require_args("avg", args);
    return sum(args) / static_cast<unsigned>(args.size());
}

// Total order: -inf < ... < -0 < +0 < ... < +inf < NaN. All NaNs are equal.
static bool total_less(const Number& a, const Number& b) {
    const bool a_nan = boost::multiprecision::isnan(a);
    const bool b_nan = boost::multiprecision::isnan(b);
    if (a_nan || b_nan) return !a_nan && b_nan;
    if (a == 0 && b == 0) return boost::multiprecision::signbit(a) && !boost::multiprecision::signbit(b);
    return a < b;
}

// min_element/max_element keep the first of equal values.
Number min(const std::vector<Number>& args) {
    require_args("min", args);
    return *std::min_element(args.begin(), args.end(), total_less);
}

Number max(const std::vector<Number>& args) {
    require_args("max", args);
    return *std::max_element(args.begin(), args.end(), total_less);
}

// Unary: extra arguments are ignored.
Number sqrt(const std::vector<Number>& args) {
    require_args("sqrt", args);
    return boost::multiprecision::sqrt(args.front());
}

Number sin(const std::vector<Number>& args) {
    require_args("sin", args);
    return boost::multiprecision::sin(args.front());
}

void install(Environment& env) {
    env.set_function("sum", &sum);
    env.set_function("avg", &avg);
    env.set_function("min", &min);
    env.set_function("max", &max);
    env.set_function("sqrt", &sqrt);
    env.set_function("sin", &sin);
}

} // namespace termcalc::builtins
