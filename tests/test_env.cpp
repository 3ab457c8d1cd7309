#include <gtest/gtest.h>
#include <termcalc/env.hpp>
#include <termcalc/parser.hpp>

#include <string>
#include <vector>

namespace {

std::vector<std::string> names(const termcalc::Environment::Range& r) {
    std::vector<std::string> out;
    for (const auto& entry : r) out.push_back(entry.first);
    return out;
}

termcalc::Environment sample() {
    termcalc::Environment env;
    env.set_variable("sin", termcalc::Number(1));
    env.set_variable("sum", termcalc::Number(1));
    env.set_variable("sqrt", termcalc::Number(1));
    env.set_variable("sq", termcalc::Number(2));
    env.set_variable("squ", termcalc::Number(3));
    env.set_variable("sr", termcalc::Number(4));
    return env;
}

TEST(Environment, VariablesRoundTrip) {
    termcalc::Environment env;
    EXPECT_EQ(env.get_variable("x"), nullptr);

    env.set_variable("x", termcalc::Number(5));
    ASSERT_NE(env.get_variable("x"), nullptr);
    EXPECT_EQ(*env.get_variable("x"), termcalc::Number(5));

    env.set_variable("x", termcalc::Number(6));
    EXPECT_EQ(*env.get_variable("x"), termcalc::Number(6));
    EXPECT_EQ(env.size(), 1u);
}

TEST(Environment, SharedKeySpaceReplacesKind) {
    termcalc::Environment env;
    env.set_variable("f", termcalc::Number(1));

    auto s = termcalc::parse("f(x) = x");
    const auto& def = std::get<termcalc::FuncAssign>(s);
    env.set_function("f", termcalc::UserFunction{def.params, def.body});

    EXPECT_EQ(env.get_variable("f"), nullptr);
    ASSERT_NE(env.get_function("f"), nullptr);
    EXPECT_EQ(env.search("f").begin()->second.kind(), termcalc::MemberKind::Function);

    env.set_variable("f", termcalc::Number(2));
    EXPECT_EQ(env.get_function("f"), nullptr);
    EXPECT_EQ(*env.get_variable("f"), termcalc::Number(2));
    EXPECT_EQ(env.size(), 1u);
}

TEST(Environment, SearchByPrefix) {
    auto env = sample();
    EXPECT_EQ(names(env.search("sq")), (std::vector<std::string>{"sq", "sqrt", "squ"}));
    EXPECT_EQ(names(env.search("sqr")), (std::vector<std::string>{"sqrt"}));
    EXPECT_EQ(names(env.search("si")), (std::vector<std::string>{"sin"}));
    EXPECT_TRUE(env.search("x").empty());
    EXPECT_TRUE(env.search("sqrtx").empty());
}

TEST(Environment, EmptyPrefixListsEverythingInOrder) {
    auto env = sample();
    EXPECT_EQ(names(env.search("")),
              (std::vector<std::string>{"sin", "sq", "sqrt", "squ", "sr", "sum"}));
}

} // namespace
