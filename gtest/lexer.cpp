#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "remin/ast/lexer.h"

using namespace remin;
using namespace remin::ast;

TEST(Lexer, Toks) {
    Lexer lexer("a(b+c)*0Z");

    auto tok = lexer.lex();
    EXPECT_TRUE(tok.isa(Tok::Tag::M_sym));
    EXPECT_EQ(tok.sym(), 'a');
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::D_paren_l));
    EXPECT_EQ(lexer.lex().sym(), 'b');
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::T_plus));
    EXPECT_EQ(lexer.lex().sym(), 'c');
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::D_paren_r));
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::T_star));
    EXPECT_EQ(lexer.lex().sym(), '0');
    EXPECT_EQ(lexer.lex().sym(), 'Z');
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::EoF));
    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::EoF));
}

TEST(Lexer, Whitespace) {
    Lexer lexer(" a \t+\n b ");

    auto a = lexer.lex();
    EXPECT_EQ(a.sym(), 'a');
    EXPECT_EQ(a.loc().begin.row, 1);
    EXPECT_EQ(a.loc().begin.col, 2);

    auto plus = lexer.lex();
    EXPECT_TRUE(plus.isa(Tok::Tag::T_plus));
    EXPECT_EQ(plus.loc().begin.col, 5);

    auto b = lexer.lex();
    EXPECT_EQ(b.sym(), 'b');
    EXPECT_EQ(b.loc().begin.col, 8);

    EXPECT_TRUE(lexer.lex().isa(Tok::Tag::EoF));
}

TEST(Lexer, Errors) {
    Lexer l1("a-b");
    l1.lex();
    EXPECT_THROW(l1.lex(), Error);

    Lexer l2("?");
    EXPECT_THROW(l2.lex(), Error);

    Lexer l3("ab\xc0");
    l3.lex();
    l3.lex();
    EXPECT_THROW(l3.lex(), Error);

    Lexer l4("_");
    try {
        l4.lex();
        FAIL() << "'_' is not a symbol";
    } catch (const Error& e) {
        EXPECT_STREQ(e.what(), "invalid input character '_'");
        EXPECT_EQ(e.loc().begin.col, 1);
    }
}

TEST(Lexer, Length) {
    auto longest = std::string(Lexer::Max_Length, 'a');
    Lexer lexer(longest);
    for (size_t i = 1; i != Lexer::Max_Length; ++i) lexer.lex();
    auto last = lexer.lex();
    EXPECT_EQ(last.sym(), 'a');
    EXPECT_EQ(last.loc().begin.col, Lexer::Max_Length);
    auto eof = lexer.lex();
    EXPECT_TRUE(eof.isa(Tok::Tag::EoF));
    EXPECT_EQ(eof.loc().begin.col, 65535);

    auto too_long = std::string(Lexer::Max_Length + 1, 'a');
    try {
        Lexer l(too_long);
        FAIL() << "pattern exceeds the limit";
    } catch (const Error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("pattern too long", 0), 0u);
        EXPECT_EQ(e.loc().begin.col, 1);
    }
}

TEST(Lexer, Tok) {
    EXPECT_STREQ(Tok::tag2str(Tok::Tag::EoF), "<end of input>");
    EXPECT_STREQ(Tok::tag2str(Tok::Tag::T_star), "*");

    std::ostringstream os;
    os << Tok(Loc(), 'x') << ' ' << Tok(Loc(), Tok::Tag::D_paren_l);
    EXPECT_EQ(os.str(), "x (");
}
