#include "remin/automaton/nfa2dfa.h"

#include <algorithm>
#include <queue>
#include <vector>

#include <absl/container/flat_hash_map.h>

namespace remin::automaton {

std::unique_ptr<DFA> nfa2dfa(const NFA& nfa) {
    auto dfa = std::make_unique<DFA>();
    if (nfa.num_states() == 0) return dfa;

    const auto alphabet = nfa.get_alphabet();
    absl::flat_hash_map<std::vector<StateId>, StateId> dfaStates; // sorted subset -> DFA state
    std::vector<StateSet> subsets;                                // DFA state -> subset
    std::queue<StateId> stateQueue;

    auto get_state = [&](StateSet&& subset) {
        auto [i, ins] = dfaStates.try_emplace(std::vector<StateId>(subset.begin(), subset.end()), 0);
        if (ins) {
            auto state = dfa->add_state();
            dfa->set_accepting(state, std::ranges::any_of(subset, [&](StateId s) { return nfa.is_accepting(s); }));
            subsets.emplace_back(std::move(subset));
            stateQueue.push(state);
            i->second = state;
        }
        return i->second;
    };

    dfa->set_start(get_state(StateSet{nfa.get_start()}));
    while (!stateQueue.empty()) {
        auto currentState = stateQueue.front();
        stateQueue.pop();
        for (auto c : alphabet) {
            StateSet target;
            for (auto nfaState : subsets[currentState])
                nfa.node(nfaState).for_transitions([&](StateId to) { target.insert(to); }, c);
            if (target.empty()) continue;
            dfa->add_transition(currentState, get_state(std::move(target)), c);
        }
    }

    return dfa;
}

} // namespace remin::automaton
