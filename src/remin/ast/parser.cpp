#include "remin/ast/parser.h"

#include <string>

namespace remin::ast {

using Tag = Tok::Tag;

Ptr<Expr> Parser::parse(std::string_view pattern, const fs::path* path) {
    Lexer lexer(pattern, path);
    lexer_ = &lexer;
    ahead_ = lexer.lex();
    prev_  = Loc(path, ahead_.loc().begin);

    auto expr = parse_expr("pattern");
    expect(Tag::EoF, "pattern");
    lexer_ = nullptr;
    return expr;
}

/*
 * Tok handling
 */

Tok Parser::lex() {
    auto result = ahead();
    prev_       = result.loc();
    ahead_      = lexer_->lex();
    return result;
}

Tok Parser::expect(Tag tag, std::string_view ctxt) {
    if (ahead().tag() == tag) return lex();

    std::string msg("'");
    msg.append(Tok::tag2str(tag)).append("'");
    syntax_err(msg, ctxt);
}

/*
 * exprs
 */

Ptr<Expr> Parser::parse_expr(std::string_view ctxt, Expr::Prec curr_prec) {
    auto track = tracker();
    auto lhs   = parse_primary_expr(ctxt);
    return parse_infix_expr(track, std::move(lhs), curr_prec);
}

Ptr<Expr> Parser::parse_infix_expr(Tracker track, Ptr<Expr>&& lhs, Expr::Prec curr_prec) {
    while (true) {
        // If operator in ahead has less left precedence: reduce (break).
        switch (ahead().tag()) {
            case Tag::T_star: {
                lex();
                lhs = ptr<StarExpr>(track, std::move(lhs));
                continue;
            }
            case Tag::T_plus: {
                if (curr_prec >= Expr::Prec::Union) return lhs;
                lex();
                auto rhs = parse_expr("right-hand side of a union", Expr::Prec::Union);
                lhs      = ptr<UnionExpr>(track, std::move(lhs), std::move(rhs));
                continue;
            }
            case Tag::M_sym:
            case Tag::D_paren_l: {
                if (curr_prec >= Expr::Prec::Concat) return lhs;
                auto rhs = parse_expr("right-hand side of a concatenation", Expr::Prec::Concat);
                lhs      = ptr<ConcatExpr>(track, std::move(lhs), std::move(rhs));
                continue;
            }
            default: return lhs;
        }
    }
}

Ptr<Expr> Parser::parse_primary_expr(std::string_view ctxt) {
    switch (ahead().tag()) {
        case Tag::M_sym: return parse_lit_expr();
        case Tag::D_paren_l: return parse_paren_expr();
        default: syntax_err("primary expression", ctxt);
    }
}

Ptr<Expr> Parser::parse_lit_expr() {
    auto tok = lex();
    return ptr<LitExpr>(tok.loc(), tok.sym());
}

Ptr<Expr> Parser::parse_paren_expr() {
    lex(); // '('
    auto expr = parse_expr("parenthesized expression");
    expect(Tag::D_paren_r, "closing delimiter of a parenthesized expression");
    return expr;
}

} // namespace remin::ast
