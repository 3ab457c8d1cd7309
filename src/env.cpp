#include "termcalc/env.hpp"
#include <utility>

namespace termcalc {

void Environment::set_variable(std::string name, Number value) {
    members_.insert_or_assign(std::move(name), Member{Member::Value(std::in_place_type<Number>, std::move(value))});
}

const Number* Environment::get_variable(std::string_view name) const {
    auto it = members_.find(name);
    if (it == members_.end()) return nullptr;
    return std::get_if<Number>(&it->second.value);
}

void Environment::set_function(std::string name, Function f) {
    members_.insert_or_assign(std::move(name), Member{Member::Value(std::in_place_type<Function>, std::move(f))});
}

const Function* Environment::get_function(std::string_view name) const {
    auto it = members_.find(name);
    if (it == members_.end()) return nullptr;
    return std::get_if<Function>(&it->second.value);
}

// Smallest string greater than every string starting with `prefix`,
// or empty when there is none ("\xff\xff").
static std::string prefix_successor(std::string_view prefix) {
    std::string s(prefix);
    while (!s.empty()) {
        unsigned char last = static_cast<unsigned char>(s.back());
        if (last != 0xff) {
            s.back() = static_cast<char>(last + 1);
            return s;
        }
        s.pop_back();
    }
    return s;
}

Environment::Range Environment::search(std::string_view prefix) const {
    auto first = members_.lower_bound(prefix);
    std::string next = prefix_successor(prefix);
    auto last = next.empty() ? members_.end() : members_.lower_bound(next);
    return Range(first, last);
}

} // namespace termcalc
