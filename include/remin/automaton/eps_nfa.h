#pragma once

#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "remin/automaton/automaton.h"

namespace remin::automaton {

class EpsNode {
public:
    EpsNode() = default;

    void add_transition(StateId to, Label label) { transitions_.emplace_back(label, to); }

    // F: void(StateId)
    template<class F> void for_transitions(F&& f, Label label) const {
        for (const auto& [l, to] : transitions_)
            if (l == label) f(to);
    }

    // F: void(Label, StateId)
    template<class F> void for_transitions(F&& f) const {
        for (const auto& [l, to] : transitions_) f(l, to);
    }

    const auto& transitions() const { return transitions_; }

    bool is_accepting() const { return accepting_; }
    void set_accepting(bool accepting) { accepting_ = accepting; }

    static constexpr std::string_view graph_name() { return "eps_nfa"; }

private:
    std::vector<std::pair<Label, StateId>> transitions_; ///< In insertion order.
    bool accepting_ = false;
};

extern template class AutomatonBase<EpsNode>;

/// Automaton with ε-transitions as produced by regex2eps.
class EpsNFA : public AutomatonBase<EpsNode> {
public:
    EpsNFA()                         = default;
    EpsNFA(const EpsNFA&)            = delete;
    EpsNFA& operator=(const EpsNFA&) = delete;
};

/// Renumbers the states of @p eps in DFS order from its start state.
/// The start state becomes `0`; a state gets its new id when first discovered and the edges of a state are pushed
/// back to front, so the first edge is explored first.
/// States that cannot be reached from the start are dropped.
std::unique_ptr<EpsNFA> renumber(const EpsNFA& eps);

} // namespace remin::automaton
