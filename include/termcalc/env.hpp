#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "termcalc/ast.hpp"
#include "termcalc/number.hpp"

namespace termcalc {

/// Native function over the evaluated argument list. Throws EvalError on bad input.
using BuiltinFn = Number (*)(const std::vector<Number>& args);

struct UserFunction {
    std::vector<std::string> params;
    ExprPtr body;
};

using Function = std::variant<BuiltinFn, UserFunction>;

enum class MemberKind { Variable, Function };

struct Member {
    using Value = std::variant<Number, Function>;
    Value value;

    MemberKind kind() const {
        return std::holds_alternative<Number>(value) ? MemberKind::Variable : MemberKind::Function;
    }
};

/// Session-wide names. Variables and functions share one ordered key space;
/// setting either kind replaces whatever the name held before.
class Environment {
public:
    using Map = std::map<std::string, Member, std::less<>>;
    using const_iterator = Map::const_iterator;

    /// Contiguous run of entries sharing a prefix, in key order.
    class Range {
    public:
        Range(const_iterator b, const_iterator e) : b_(b), e_(e) {}
        const_iterator begin() const { return b_; }
        const_iterator end() const { return e_; }
        bool empty() const { return b_ == e_; }

    private:
        const_iterator b_;
        const_iterator e_;
    };

    void set_variable(std::string name, Number value);
    const Number* get_variable(std::string_view name) const;

    void set_function(std::string name, Function f);
    const Function* get_function(std::string_view name) const;

    /// Entries whose key starts with `prefix`, found by two ordered lookups.
    /// An empty prefix yields everything.
    Range search(std::string_view prefix) const;

    std::size_t size() const { return members_.size(); }

private:
    Map members_;
};

} // namespace termcalc
