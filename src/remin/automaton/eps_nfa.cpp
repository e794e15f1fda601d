#include "remin/automaton/eps_nfa.h"

#include <absl/container/flat_hash_map.h>

namespace remin::automaton {

template class AutomatonBase<EpsNode>;

std::unique_ptr<EpsNFA> renumber(const EpsNFA& eps) {
    auto res = std::make_unique<EpsNFA>();
    if (eps.num_states() == 0) return res;

    absl::flat_hash_map<StateId, StateId> old2new;
    std::vector<StateId> stack;

    old2new.emplace(eps.get_start(), res->add_state());
    stack.push_back(eps.get_start());
    while (!stack.empty()) {
        auto curr = stack.back();
        stack.pop_back();
        const auto& edges = eps.node(curr).transitions();
        // reverse, so the first edge ends up on top of the stack
        for (auto i = edges.rbegin(), e = edges.rend(); i != e; ++i) {
            auto to = i->second;
            if (!old2new.contains(to)) {
                old2new.emplace(to, res->add_state());
                stack.push_back(to);
            }
        }
    }

    for (const auto& [old_state, new_state] : old2new) {
        auto from = new_state;
        eps.node(old_state).for_transitions([&](Label label, StateId to) {
            res->add_transition(from, old2new.at(to), label);
        });
        res->set_accepting(from, eps.is_accepting(old_state));
    }
    res->set_start(0);
    return res;
}

} // namespace remin::automaton
