#pragma once

#include "remin/automaton/automaton.h"

#include "remin/util/dbg.h"

namespace remin::ast {

// clang-format off
#define REMIN_TOK(m)                  \
    m(EoF,       "<end of input>")    \
    m(M_sym,     "<symbol>"      )    \
    /* delimiters */                  \
    m(D_paren_l, "("             )    \
    m(D_paren_r, ")"             )    \
    /* operators */                   \
    m(T_plus,    "+"             )    \
    m(T_star,    "*"             )
// clang-format on

class Tok {
public:
    /// @name Tag
    ///@{
    enum class Tag {
#define CODE(t, str) t,
        REMIN_TOK(CODE)
#undef CODE
    };

    static const char* tag2str(Tok::Tag);
    ///@}

    /// @name Constructors
    ///@{
    Tok() {}
    Tok(Loc loc, Tag tag)
        : loc_(loc)
        , tag_(tag) {}
    Tok(Loc loc, automaton::Symbol sym)
        : loc_(loc)
        , tag_(Tag::M_sym)
        , sym_(sym) {}
    ///@}

    /// @name Getters
    ///@{
    Loc loc() const { return loc_; }
    Tag tag() const { return tag_; }
    bool isa(Tag tag) const { return tag == tag_; }
    automaton::Symbol sym() const {
        assert(isa(Tag::M_sym));
        return sym_;
    }
    ///@}

    friend std::ostream& operator<<(std::ostream&, Tok);

private:
    Loc loc_;
    Tag tag_               = Tag::EoF;
    automaton::Symbol sym_ = '\0';
};

} // namespace remin::ast
