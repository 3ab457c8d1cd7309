#include <gtest/gtest.h>
#include <termcalc/format.hpp>

#include <stdexcept>
#include <string>

namespace {

std::string fmt_num(const char* literal, std::size_t digits) {
    return termcalc::format_number(termcalc::Number(literal), digits);
}

TEST(Format, DecimalRegimes) {
    EXPECT_EQ(fmt_num("1234.11", 4), "1234");
    EXPECT_EQ(fmt_num("-1234.11", 4), "-1234");
    EXPECT_EQ(fmt_num("12.340000", 6), "12.34");
    EXPECT_EQ(fmt_num("0.01230", 4), "0.0123");
    EXPECT_EQ(fmt_num("0.0001234", 4), "0.0001234");
    EXPECT_EQ(fmt_num("0.01233", 3), "0.0123");
    EXPECT_EQ(fmt_num("0.3", 16), "0.3");
}

TEST(Format, ScientificRegime) {
    EXPECT_EQ(fmt_num("12300", 2), "1.2e4");
    EXPECT_EQ(fmt_num("0.000001233", 3), "1.23e-6");
    EXPECT_EQ(fmt_num("-12300", 2), "-1.2e4");
    EXPECT_EQ(fmt_num("100000", 3), "1e5");
}

TEST(Format, Zero) {
    EXPECT_EQ(fmt_num("000", 2), "0");
    EXPECT_EQ(termcalc::format_number(termcalc::Number(0), termcalc::kDisplayDigits), "0");
}

TEST(Format, IntegersWithinDigits) {
    EXPECT_EQ(fmt_num("100", 4), "100");
    EXPECT_EQ(fmt_num("42", 32), "42");
}

TEST(Format, RoundsToNearest) {
    EXPECT_EQ(fmt_num("2.345678", 3), "2.35");
    EXPECT_EQ(fmt_num("9.996", 3), "10");
    EXPECT_EQ(termcalc::format_number(termcalc::Number(1) / 3, 5), "0.33333");
}

TEST(Format, SingleDigit) {
    EXPECT_EQ(fmt_num("7", 1), "7");
    EXPECT_EQ(fmt_num("0.26", 1), "0.3");
    EXPECT_EQ(fmt_num("96", 1), "1e2");
}

TEST(Format, HalvesRoundToEven) {
    EXPECT_EQ(fmt_num("2.5", 1), "2");
    EXPECT_EQ(fmt_num("0.25", 1), "0.2");
    EXPECT_EQ(fmt_num("1.5", 1), "2");
    EXPECT_EQ(fmt_num("3.5", 1), "4");
    EXPECT_EQ(fmt_num("-2.5", 1), "-2");
}

TEST(Format, NonFinite) {
    termcalc::Number one(1), zero(0);
    EXPECT_EQ(termcalc::format_number(one / zero, 4), "inf");
    EXPECT_EQ(termcalc::format_number(-one / zero, 4), "-inf");
}

TEST(Format, ZeroDigitsRejected) {
    EXPECT_THROW(termcalc::format_number(termcalc::Number(1), 0), std::invalid_argument);
}

TEST(IdentRange, IdentifierAtEnd) {
    EXPECT_EQ(termcalc::ident_at_end("1abc"), std::optional<std::string_view>("abc"));
    EXPECT_EQ(termcalc::ident_at_end("abc+bob1bob1"), std::optional<std::string_view>("bob1bob1"));
    EXPECT_EQ(termcalc::ident_at_end("abc "), std::nullopt);
    EXPECT_EQ(termcalc::ident_at_end("12"), std::nullopt);
    EXPECT_EQ(termcalc::ident_at_end(""), std::nullopt);
}

TEST(IdentRange, RangeEndingInsideInput) {
    auto r = termcalc::ident_range("sqrt(2)+sin", 4);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->first, 0u);
    EXPECT_EQ(r->second, 4u);

    EXPECT_FALSE(termcalc::ident_range("sqrt(2)+sin", 5).has_value());
}

} // namespace
