#pragma once

#include <cassert>
#include <cstdint>

#include <deque>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <vector>

#include <absl/container/btree_set.h>

namespace remin::automaton {

using StateId  = std::uint32_t;
using Symbol   = char;
using StateSet = absl::btree_set<StateId>;
using Alphabet = absl::btree_set<Symbol>;

/// Transition label of an EpsNFA: either ε or a concrete Symbol.
class Label {
public:
    constexpr Label() noexcept = default; ///< ε
    constexpr Label(Symbol sym) noexcept
        : sym_(sym)
        , eps_(false) {}

    static constexpr Label eps() noexcept { return {}; }

    bool is_eps() const noexcept { return eps_; }
    Symbol sym() const {
        assert(!is_eps() && "ε has no symbol");
        return sym_;
    }

    bool operator==(const Label&) const noexcept = default;

    friend std::ostream& operator<<(std::ostream& os, Label label);

private:
    Symbol sym_ = '\0';
    bool eps_   = true;
};

/// Writes @p sym as it appears inside a quoted DOT label.
std::ostream& escape(std::ostream& os, Symbol sym);

/// Densely numbered states of type @p NodeType.
/// A `NodeType` provides `for_transitions(F)` with `F: void(L, StateId)`, `add_transition(StateId, L)`, and
/// `is_accepting`/`set_accepting`.
template<class NodeType> class AutomatonBase {
public:
    AutomatonBase()                                = default;
    AutomatonBase(const AutomatonBase&)            = delete;
    AutomatonBase& operator=(const AutomatonBase&) = delete;

    /// Allocates the next StateId; ids are handed out in increasing order starting at 0.
    StateId add_state() {
        nodes_.emplace_back();
        return StateId(nodes_.size() - 1);
    }

    /// @name Getters
    ///@{
    size_t num_states() const { return nodes_.size(); }
    const NodeType& node(StateId s) const {
        assert(s < nodes_.size() && "invalid state");
        return nodes_[s];
    }
    NodeType& node(StateId s) {
        assert(s < nodes_.size() && "invalid state");
        return nodes_[s];
    }
    StateId get_start() const { return start_; }
    bool is_accepting(StateId s) const { return node(s).is_accepting(); }
    ///@}

    /// @name Setters
    ///@{
    void set_start(StateId start) {
        assert(start < nodes_.size() && "invalid state");
        start_ = start;
    }
    void set_accepting(StateId s, bool accepting = true) { node(s).set_accepting(accepting); }
    template<class L> void add_transition(StateId from, StateId to, L label) {
        assert(to < nodes_.size() && "invalid state");
        node(from).add_transition(to, label);
    }
    ///@}

    /// @name Queries
    ///@{
    StateSet get_accepting_states() const {
        StateSet acceptingStates;
        for (StateId s = 0; s != nodes_.size(); ++s)
            if (nodes_[s].is_accepting()) acceptingStates.insert(s);
        return acceptingStates;
    }

    /// Every state that can be reached from the start state; includes the start state itself.
    StateSet get_reachable_states() const {
        StateSet reachableStates;
        if (nodes_.empty()) return reachableStates;
        std::vector<StateId> workList;
        workList.push_back(get_start());
        while (!workList.empty()) {
            auto state = workList.back();
            workList.pop_back();
            if (!reachableStates.insert(state).second) continue;
            node(state).for_transitions([&](auto, StateId to) {
                if (!reachableStates.contains(to)) workList.push_back(to);
            });
        }
        return reachableStates;
    }

    /// All symbols used by some transition; ε is not a symbol.
    Alphabet get_alphabet() const {
        Alphabet alphabet;
        for (const auto& n : nodes_) {
            n.for_transitions([&](auto label, StateId) {
                if constexpr (std::is_same_v<decltype(label), Label>) {
                    if (!label.is_eps()) alphabet.insert(label.sym());
                } else {
                    alphabet.insert(label);
                }
            });
        }
        return alphabet;
    }

    size_t num_transitions() const {
        size_t n = 0;
        for (const auto& node : nodes_) node.for_transitions([&](auto, StateId) { ++n; });
        return n;
    }
    ///@}

    /// Graphviz' DOT language.
    friend std::ostream& operator<<(std::ostream& os, const AutomatonBase& automaton) {
        os << "digraph " << NodeType::graph_name() << " {\n";
        os << "  rankdir=LR;\n  node [shape=circle];\n";
        if (!automaton.nodes_.empty()) os << "  start [shape=point];\n  start -> " << automaton.start_ << ";\n";
        for (StateId s = 0; s != automaton.nodes_.size(); ++s) {
            automaton.nodes_[s].for_transitions([&](auto label, StateId to) {
                os << "  " << s << " -> " << to << " [label=\"";
                if constexpr (std::is_same_v<decltype(label), Label>)
                    os << label;
                else
                    escape(os, label);
                os << "\"];\n";
            });
        }
        for (StateId s = 0; s != automaton.nodes_.size(); ++s)
            if (automaton.nodes_[s].is_accepting()) os << "  " << s << " [shape=doublecircle];\n";
        return os << "}\n";
    }

private:
    std::deque<NodeType> nodes_;
    StateId start_ = 0;
};

} // namespace remin::automaton
