#include "remin/ast/lexer.h"

#include <cctype>

namespace remin::ast {

Lexer::Lexer(std::string_view pattern, const fs::path* path)
    : pattern_(pattern)
    , path_(path) {
    if (pattern_.size() > Max_Length)
        error(Loc(path_, Pos(1, 1)), "pattern too long: {} characters exceed the limit of {}", pattern_.size(),
              Max_Length);
}

Tok Lexer::lex() {
    while (true) {
        if (i_ == pattern_.size()) return tok(Tok::Tag::EoF);

        auto c     = pattern_[i_];
        auto uc    = static_cast<unsigned char>(c);
        auto token = [&](Tok::Tag tag) {
            auto res = tok(tag);
            ++i_;
            return res;
        };

        if (std::isspace(uc)) {
            ++i_;
            continue;
        }

        // clang-format off
        switch (c) {
            case '(': return token(Tok::Tag::D_paren_l);
            case ')': return token(Tok::Tag::D_paren_r);
            case '+': return token(Tok::Tag::T_plus);
            case '*': return token(Tok::Tag::T_star);
            default: break;
        }
        // clang-format on

        if (uc < 0x80 && std::isalnum(uc)) {
            auto res = Tok(loc(), c);
            ++i_;
            return res;
        }

        if (uc < 0x80 && std::isprint(uc)) error(loc(), "invalid input character '{}'", c);
        error(loc(), "invalid input character with code {}", unsigned(uc));
    }
}

} // namespace remin::ast
