#pragma once

#include <memory>
#include <string_view>

#include "remin/flags.h"

#include "remin/ast/ast.h"
#include "remin/automaton/dfa.h"
#include "remin/automaton/eps_nfa.h"
#include "remin/automaton/nfa.h"
#include "remin/util/log.h"

namespace remin {

/// Runs the whole pipeline from a pattern to a minimal automaton.
/// Owns the Flags, the Log, and the memory of all parsed patterns.
class Driver {
public:
    /// @name Getters
    ///@{
    Flags& flags() { return flags_; }
    const Flags& flags() const { return flags_; }
    Log& log() const { return log_; }
    ///@}

    /// Every stage of a single run; Automata::min is `nullptr` if Flags::minimize is off.
    struct Automata {
        std::unique_ptr<automaton::EpsNFA> eps;
        std::unique_ptr<automaton::NFA> nfa;
        std::unique_ptr<automaton::DFA> dfa;
        std::unique_ptr<automaton::DFA> min;

        /// The last stage that has been built.
        const automaton::DFA& result() const { return min ? *min : *dfa; }
    };

    /// @name Pipeline
    ///@{
    ast::Ptr<ast::Expr> parse(std::string_view pattern);
    Automata compile(const ast::Expr& regex) const;
    Automata compile(std::string_view pattern);
    ///@}

private:
    Flags flags_;
    mutable Log log_;
    ast::AST ast_;
    fs::path path_ = "<pattern>";
};

} // namespace remin
