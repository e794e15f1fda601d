#include "remin/automaton/dfa.h"

namespace remin::automaton {

std::optional<StateId> DFANode::get_transition(Symbol c) const {
    if (auto i = transitions_.find(c); i != transitions_.end()) return i->second;
    return {};
}

template class AutomatonBase<DFANode>;

bool accepts(const DFA& dfa, std::string_view input) {
    if (dfa.num_states() == 0) return false;

    auto state = dfa.get_start();
    for (auto c : input) {
        auto next = dfa.get_transition(state, c);
        if (!next) return false;
        state = *next;
    }
    return dfa.is_accepting(state);
}

} // namespace remin::automaton
