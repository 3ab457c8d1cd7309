#include "termcalc/number.hpp"
#include <string>

namespace termcalc {

Number parse_number(std::string_view text) {
    return Number(std::string(text).c_str());
}

} // namespace termcalc
