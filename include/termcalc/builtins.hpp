#pragma once
#include <vector>

#include "termcalc/env.hpp"
#include "termcalc/number.hpp"

namespace termcalc::builtins {

Number sum(const std::vector<Number>& args);
Number avg(const std::vector<Number>& args);
Number min(const std::vector<Number>& args);
Number max(const std::vector<Number>& args);
Number sqrt(const std::vector<Number>& args);
Number sin(const std::vector<Number>& args);

/// Add sum, avg, min, max, sqrt and sin to `env`.
void install(Environment& env);

} // namespace termcalc::builtins
