#include "remin/automaton/nfa.h"

#include <algorithm>

namespace remin::automaton {

void NFANode::add_transition(StateId to, Symbol c) {
    auto edge = std::pair(c, to);
    if (std::ranges::find(transitions_, edge) == transitions_.end()) transitions_.push_back(edge);
}

std::vector<StateId> NFANode::get_transitions(Symbol c) const {
    std::vector<StateId> res;
    for_transitions([&](StateId to) { res.push_back(to); }, c);
    return res;
}

template class AutomatonBase<NFANode>;

bool accepts(const NFA& nfa, std::string_view input) {
    if (nfa.num_states() == 0) return false;

    StateSet curr{nfa.get_start()};
    for (auto c : input) {
        StateSet next;
        for (auto s : curr) nfa.node(s).for_transitions([&](StateId to) { next.insert(to); }, c);
        if (next.empty()) return false;
        curr = std::move(next);
    }

    return std::ranges::any_of(curr, [&](StateId s) { return nfa.is_accepting(s); });
}

} // namespace remin::automaton
