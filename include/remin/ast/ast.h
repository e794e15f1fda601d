#pragma once

#include <fe/arena.h>
#include <fe/assert.h>
#include <fe/cast.h>

#include "remin/automaton/automaton.h"

#include "remin/util/dbg.h"

namespace remin::ast {

using automaton::Symbol;

template<class T> using Ptr = fe::Arena::Ptr<const T>;

/// Owns the memory of all Node%s created via AST::ptr.
class AST {
public:
    AST() = default;
    AST(const AST&) = delete;
    AST(AST&& other)
        : AST() {
        swap(*this, other);
    }

    template<class T, class... Args> auto ptr(Args&&... args) {
        return arena_.mk<const T>(std::forward<Args&&>(args)...);
    }

    friend void swap(AST& a1, AST& a2) noexcept {
        using std::swap;
        swap(a1.arena_, a2.arena_);
    }

private:
    fe::Arena arena_;
};

class Node : public fe::RuntimeCast<Node> {
protected:
    Node(Loc loc)
        : loc_(loc) {}
    virtual ~Node() {}

public:
    Loc loc() const { return loc_; }

    virtual std::ostream& stream(std::ostream&) const = 0;

private:
    Loc loc_;
};

class Expr : public Node {
protected:
    Expr(Loc loc)
        : Node(loc) {}

public:
    /// Binding strength of the operators; higher binds tighter.
    enum class Prec {
        Bot,
        Union,
        Concat,
        Star,
    };

    /// Number of Node%s in this tree.
    virtual size_t num_nodes() const = 0;
};

/// `c`
class LitExpr : public Expr {
public:
    LitExpr(Loc loc, Symbol sym)
        : Expr(loc)
        , sym_(sym) {}

    Symbol sym() const { return sym_; }

    size_t num_nodes() const override { return 1; }
    std::ostream& stream(std::ostream&) const override;

private:
    Symbol sym_;
};

/// `lhs rhs`
class ConcatExpr : public Expr {
public:
    ConcatExpr(Loc loc, Ptr<Expr>&& lhs, Ptr<Expr>&& rhs)
        : Expr(loc)
        , lhs_(std::move(lhs))
        , rhs_(std::move(rhs)) {}

    const Expr* lhs() const { return lhs_.get(); }
    const Expr* rhs() const { return rhs_.get(); }

    size_t num_nodes() const override { return 1 + lhs()->num_nodes() + rhs()->num_nodes(); }
    std::ostream& stream(std::ostream&) const override;

private:
    Ptr<Expr> lhs_;
    Ptr<Expr> rhs_;
};

/// `lhs + rhs`
class UnionExpr : public Expr {
public:
    UnionExpr(Loc loc, Ptr<Expr>&& lhs, Ptr<Expr>&& rhs)
        : Expr(loc)
        , lhs_(std::move(lhs))
        , rhs_(std::move(rhs)) {}

    const Expr* lhs() const { return lhs_.get(); }
    const Expr* rhs() const { return rhs_.get(); }

    size_t num_nodes() const override { return 1 + lhs()->num_nodes() + rhs()->num_nodes(); }
    std::ostream& stream(std::ostream&) const override;

private:
    Ptr<Expr> lhs_;
    Ptr<Expr> rhs_;
};

/// `body*`
class StarExpr : public Expr {
public:
    StarExpr(Loc loc, Ptr<Expr>&& body)
        : Expr(loc)
        , body_(std::move(body)) {}

    const Expr* body() const { return body_.get(); }

    size_t num_nodes() const override { return 1 + body()->num_nodes(); }
    std::ostream& stream(std::ostream&) const override;

private:
    Ptr<Expr> body_;
};

/// Fully parenthesized form, e.g. `((a+b)*c)`.
std::ostream& operator<<(std::ostream& os, const Expr& expr);

} // namespace remin::ast
