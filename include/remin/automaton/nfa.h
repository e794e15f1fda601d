#pragma once

#include <string_view>
#include <utility>
#include <vector>

#include "remin/automaton/automaton.h"

namespace remin::automaton {

class NFANode {
public:
    NFANode() = default;

    /// Several transitions on the same Symbol are fine; an identical (Symbol, StateId) pair is only added once.
    void add_transition(StateId to, Symbol c);
    std::vector<StateId> get_transitions(Symbol c) const;

    // F: void(StateId)
    template<class F> void for_transitions(F&& f, Symbol c) const {
        for (const auto& [c_, to] : transitions_)
            if (c_ == c) f(to);
    }

    // F: void(Symbol, StateId)
    template<class F> void for_transitions(F&& f) const {
        for (const auto& [c, to] : transitions_) f(c, to);
    }

    bool is_accepting() const { return accepting_; }
    void set_accepting(bool accepting) { accepting_ = accepting; }

    static constexpr std::string_view graph_name() { return "nfa"; }

private:
    std::vector<std::pair<Symbol, StateId>> transitions_;
    bool accepting_ = false;
};

extern template class AutomatonBase<NFANode>;

/// ε-free, possibly nondeterministic automaton.
class NFA : public AutomatonBase<NFANode> {
public:
    NFA()                      = default;
    NFA(const NFA&)            = delete;
    NFA& operator=(const NFA&) = delete;
};

/// Simulates @p nfa on @p input by tracking the set of active states.
bool accepts(const NFA& nfa, std::string_view input);

} // namespace remin::automaton
