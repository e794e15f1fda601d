#pragma once

#include <optional>
#include <string_view>

#include <absl/container/flat_hash_map.h>

#include "remin/automaton/automaton.h"

namespace remin::automaton {

class DFANode {
public:
    DFANode() = default;

    /// Overwrites a previous transition on @p c.
    void add_transition(StateId to, Symbol c) { transitions_[c] = to; }
    std::optional<StateId> get_transition(Symbol c) const;

    // F: void(StateId)
    template<class F> void for_transitions(F&& f, Symbol c) const {
        if (auto it = transitions_.find(c); it != transitions_.end()) f(it->second);
    }

    // F: void(Symbol, StateId)
    template<class F> void for_transitions(F&& f) const {
        for (auto& [c, to] : transitions_) f(c, to);
    }

    size_t num_transitions() const { return transitions_.size(); }

    bool is_accepting() const noexcept { return accepting_; }
    void set_accepting(bool accepting) noexcept { accepting_ = accepting; }

    static constexpr std::string_view graph_name() { return "dfa"; }

private:
    absl::flat_hash_map<Symbol, StateId> transitions_;
    bool accepting_ = false;
};

extern template class AutomatonBase<DFANode>;

/// At most one transition per Symbol and state; a missing transition rejects.
class DFA : public AutomatonBase<DFANode> {
public:
    DFA()                      = default;
    DFA(const DFA&)            = delete;
    DFA& operator=(const DFA&) = delete;

    std::optional<StateId> get_transition(StateId from, Symbol c) const { return node(from).get_transition(c); }
};

/// Runs @p dfa on @p input; rejects as soon as a Symbol has no transition.
bool accepts(const DFA& dfa, std::string_view input);

} // namespace remin::automaton
