#include "remin/automaton/eps2nfa.h"

#include <algorithm>
#include <queue>
#include <vector>

#include <absl/container/flat_hash_map.h>
#include <fe/assert.h>

namespace remin::automaton {

namespace {

bool contains_accepting(const EpsNFA& eps, const StateSet& states) {
    return std::ranges::any_of(states, [&](StateId s) { return eps.is_accepting(s); });
}

/// Canonical key: the ids of @p states in ascending order.
std::vector<StateId> key(const StateSet& states) { return {states.begin(), states.end()}; }

std::unique_ptr<NFA> merge_closures(const EpsNFA& eps) {
    auto nfa = std::make_unique<NFA>();
    if (eps.num_states() == 0) return nfa;

    const auto alphabet = eps.get_alphabet();
    absl::flat_hash_map<std::vector<StateId>, StateId> closure2state;
    std::vector<StateSet> closures; // indexed by NFA state
    std::queue<StateId> stateQueue;

    auto get_state = [&](StateSet&& closure) {
        auto [i, ins] = closure2state.try_emplace(key(closure), 0);
        if (ins) {
            auto state = nfa->add_state();
            nfa->set_accepting(state, contains_accepting(eps, closure));
            closures.emplace_back(std::move(closure));
            stateQueue.push(state);
            i->second = state;
        }
        return i->second;
    };

    nfa->set_start(get_state(eps_closure(eps, eps.get_start())));
    while (!stateQueue.empty()) {
        auto curr = stateQueue.front();
        stateQueue.pop();
        for (auto c : alphabet) {
            // get_state may grow closures, so don't hold a reference into it
            auto target = eps_closure(eps, move_on(eps, closures[curr], c));
            if (target.empty()) continue;
            nfa->add_transition(curr, get_state(std::move(target)), c);
        }
    }

    return nfa;
}

std::unique_ptr<NFA> per_state(const EpsNFA& eps) {
    auto nfa            = std::make_unique<NFA>();
    const auto alphabet = eps.get_alphabet();

    for (size_t i = 0, e = eps.num_states(); i != e; ++i) nfa->add_state();

    for (StateId s = 0, e = eps.num_states(); s != e; ++s) {
        auto closure = eps_closure(eps, s);
        nfa->set_accepting(s, contains_accepting(eps, closure));
        for (auto c : alphabet) {
            auto moved = move_on(eps, closure, c);
            if (moved.empty()) continue;
            for (auto to : eps_closure(eps, moved)) nfa->add_transition(s, to, c);
        }
    }

    if (eps.num_states() != 0) nfa->set_start(eps.get_start());
    return nfa;
}

} // namespace

StateSet eps_closure(const EpsNFA& eps, StateId state) { return eps_closure(eps, StateSet{state}); }

StateSet eps_closure(const EpsNFA& eps, const StateSet& states) {
    StateSet closure;
    std::queue<StateId> stateQueue;
    for (auto state : states)
        if (closure.insert(state).second) stateQueue.push(state);

    while (!stateQueue.empty()) {
        auto currentState = stateQueue.front();
        stateQueue.pop();
        eps.node(currentState).for_transitions(
            [&](StateId to) {
                if (closure.insert(to).second) stateQueue.push(to);
            },
            Label::eps());
    }
    return closure;
}

StateSet move_on(const EpsNFA& eps, const StateSet& states, Symbol c) {
    StateSet res;
    for (auto state : states) eps.node(state).for_transitions([&](StateId to) { res.insert(to); }, Label(c));
    return res;
}

bool accepts(const EpsNFA& eps, std::string_view input) {
    if (eps.num_states() == 0) return false;

    auto curr = eps_closure(eps, eps.get_start());
    for (auto c : input) {
        curr = eps_closure(eps, move_on(eps, curr, c));
        if (curr.empty()) return false;
    }
    return contains_accepting(eps, curr);
}

std::unique_ptr<NFA> eps2nfa(const EpsNFA& eps, Eps2Nfa strategy) {
    switch (strategy) {
        case Eps2Nfa::Merge: return merge_closures(eps);
        case Eps2Nfa::PerState: return per_state(eps);
        default: fe::unreachable();
    }
}

} // namespace remin::automaton
