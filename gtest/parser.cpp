#include <sstream>

#include <gtest/gtest.h>

#include "remin/driver.h"

#include "remin/ast/parser.h"

using namespace remin;
using namespace remin::ast;

namespace {

std::string parse(const char* pattern) {
    Driver driver;
    std::ostringstream os;
    os << *driver.parse(pattern);
    return os.str();
}

std::string parse_err(const char* pattern) {
    Driver driver;
    try {
        driver.parse(pattern);
    } catch (const Error& e) {
        return e.what();
    }
    return {};
}

} // namespace

TEST(Parser, Prec) {
    EXPECT_EQ(parse("a"), "a");
    EXPECT_EQ(parse("ab"), "(ab)");
    EXPECT_EQ(parse("a+b"), "(a+b)");
    EXPECT_EQ(parse("a*"), "(a)*");
    EXPECT_EQ(parse("ab*"), "(a(b)*)");
    EXPECT_EQ(parse("a+bc*"), "(a+(b(c)*))");
    EXPECT_EQ(parse("(a+b)*c"), "(((a+b))*c)");
    EXPECT_EQ(parse("(ab)*"), "((ab))*");
    EXPECT_EQ(parse("a**"), "((a)*)*");
    EXPECT_EQ(parse("((a))"), "a");
    EXPECT_EQ(parse(" a + b "), "(a+b)");
}

TEST(Parser, Assoc) {
    EXPECT_EQ(parse("abc"), "((ab)c)");
    EXPECT_EQ(parse("a+b+c"), "((a+b)+c)");
    EXPECT_EQ(parse("ab+cd"), "((ab)+(cd))");
    EXPECT_EQ(parse("a(b+c)d"), "((a(b+c))d)");
}

TEST(Parser, Nodes) {
    Driver driver;
    auto expr = driver.parse("(a+b)*c");
    EXPECT_EQ(expr->num_nodes(), 6u);

    auto concat = expr->isa<ConcatExpr>();
    ASSERT_TRUE(concat);
    auto star = concat->lhs()->isa<StarExpr>();
    ASSERT_TRUE(star);
    EXPECT_TRUE(star->body()->isa<UnionExpr>());
    auto lit = concat->rhs()->isa<LitExpr>();
    ASSERT_TRUE(lit);
    EXPECT_EQ(lit->sym(), 'c');
    EXPECT_EQ(lit->loc().begin.col, 7);
    EXPECT_EQ(expr->loc().begin.col, 1);
    EXPECT_EQ(expr->loc().finis.col, 7);
}

TEST(Parser, Errors) {
    EXPECT_EQ(parse_err(""), "expected primary expression, got '<end of input>' while parsing pattern");
    EXPECT_EQ(parse_err("(a"),
              "expected ')', got '<end of input>' while parsing closing delimiter of a parenthesized expression");
    EXPECT_EQ(parse_err("a)"), "expected '<end of input>', got ')' while parsing pattern");
    EXPECT_EQ(parse_err("a+"),
              "expected primary expression, got '<end of input>' while parsing right-hand side of a union");
    EXPECT_EQ(parse_err("+a"), "expected primary expression, got '+' while parsing pattern");
    EXPECT_EQ(parse_err("*"), "expected primary expression, got '*' while parsing pattern");
    EXPECT_EQ(parse_err("()"), "expected primary expression, got ')' while parsing parenthesized expression");
    EXPECT_EQ(parse_err("a-b"), "invalid input character '-'");

    Driver driver;
    EXPECT_THROW(driver.parse("a+*"), Error);
    EXPECT_THROW(driver.parse("(a+b"), Error);
    EXPECT_THROW(driver.parse("a b)"), Error);
}

TEST(Error, Loc) {
    auto path = fs::path("<test>");
    try {
        error(Loc(&path, Pos(1, 3)), "'{}' is never matched", 'x');
        FAIL() << "error() must throw";
    } catch (const Error& e) {
        EXPECT_STREQ(e.what(), "'x' is never matched");
        EXPECT_EQ(e.msg(), "'x' is never matched");
        EXPECT_EQ(e.loc().begin.row, 1);
        EXPECT_EQ(e.loc().begin.col, 3);

        std::ostringstream os;
        os << e;
        EXPECT_NE(os.str().find("error: "), std::string::npos);
        EXPECT_NE(os.str().find("'x' is never matched"), std::string::npos);
    }
}

TEST(Print, Fmt) {
    EXPECT_EQ(fmt("{} -> {{{}}}", 'a', 23), "a -> {23}");
    EXPECT_EQ(fmt("{}{}", "ab", std::string("cd")), "abcd");
    EXPECT_EQ(fmt("}}{{"), "}{");
}
