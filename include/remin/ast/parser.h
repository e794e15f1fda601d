#pragma once

#include <string_view>

#include "remin/ast/ast.h"
#include "remin/ast/lexer.h"

namespace remin::ast {

/// Parses a pattern into an AST by precedence climbing.
/// ```
/// e = s                   literal: ASCII letter or digit
///   | e e                 concatenation (left-assoc)
///   | e + e               union (left-assoc, binds weakest)
///   | e *                 Kleene star (binds tightest)
///   | ( e )
/// ```
/// Syntax errors `throw` an remin::Error.
///
/// A `parse_*` method with a `std::string_view ctxt` parameter checks its FIRST set itself and uses `ctxt` in the
/// error message; all others rely on the caller to have checked.
class Parser {
public:
    Parser(AST& ast)
        : ast_(ast) {}

    /// The whole @p pattern must form a single expression.
    Ptr<Expr> parse(std::string_view pattern, const fs::path* path = nullptr);

private:
    template<class T, class... Args> auto ptr(Args&&... args) {
        return ast_.ptr<const T>(std::forward<Args&&>(args)...);
    }

    /// Remembers the start of a construct to build its Loc once it is complete.
    class Tracker {
    public:
        Tracker(const Parser& parser, Pos pos)
            : parser_(parser)
            , pos_(pos) {}

        operator Loc() const { return {parser_.prev_.path, pos_, parser_.prev_.finis}; }

    private:
        const Parser& parser_;
        Pos pos_;
    };

    Tracker tracker() { return {*this, ahead().loc().begin}; }

    /// @name Tok handling
    ///@{
    const Tok& ahead() const { return ahead_; }
    Tok lex();
    Tok expect(Tok::Tag tag, std::string_view ctxt);
    ///@}

    /// @name parse exprs
    ///@{
    Ptr<Expr> parse_expr(std::string_view ctxt, Expr::Prec = Expr::Prec::Bot);
    Ptr<Expr> parse_primary_expr(std::string_view ctxt);
    Ptr<Expr> parse_infix_expr(Tracker, Ptr<Expr>&& lhs, Expr::Prec = Expr::Prec::Bot);
    Ptr<Expr> parse_lit_expr();
    Ptr<Expr> parse_paren_expr();
    ///@}

    /// @name error messages
    ///@{
    /// Issue an error message of the form:
    /// "expected \<what\>, got '\<tok>\' while parsing \<ctxt\>"
    [[noreturn]] void syntax_err(std::string_view what, const Tok& tok, std::string_view ctxt) {
        error(tok.loc(), "expected {}, got '{}' while parsing {}", what, tok, ctxt);
    }

    /// Same above but uses @p ahead() as @p tok.
    [[noreturn]] void syntax_err(std::string_view what, std::string_view ctxt) { syntax_err(what, ahead(), ctxt); }
    ///@}

    AST& ast_;
    Lexer* lexer_ = nullptr;
    Tok ahead_;
    Loc prev_;
};

} // namespace remin::ast
