#include "remin/automaton/dfamin.h"

#include <deque>
#include <optional>
#include <queue>
#include <vector>

#include <absl/container/flat_hash_map.h>

using namespace remin::automaton;

namespace {

using Partition = std::vector<StateSet>;

StateSet get_referenced_states(const DFA& dfa) {
    StateSet states;
    states.insert(dfa.get_start());
    for (StateId s = 0, e = dfa.num_states(); s != e; ++s) {
        if (dfa.is_accepting(s)) states.insert(s);
        dfa.node(s).for_transitions([&](auto, StateId to) {
            states.insert(s);
            states.insert(to);
        });
    }
    return states;
}

StateSet operator-(const StateSet& lhs, const StateSet& rhs) {
    StateSet result;
    for (auto state : lhs)
        if (!rhs.contains(state)) result.insert(state);
    return result;
}

StateSet operator*(const StateSet& lhs, const StateSet& rhs) {
    StateSet result;
    for (auto state : lhs)
        if (rhs.contains(state)) result.insert(state);
    return result;
}

absl::flat_hash_map<StateId, size_t> get_classes(const Partition& P) {
    absl::flat_hash_map<StateId, size_t> state2class;
    for (size_t i = 0, e = P.size(); i != e; ++i)
        for (auto state : P[i]) state2class.emplace(state, i);
    return state2class;
}

/// Checks that all members of a class agree, for every symbol, on the class they move to.
bool is_stable(const DFA& dfa, const Partition& P, const Alphabet& alphabet) {
    auto state2class = get_classes(P);
    auto target      = [&](StateId s, Symbol c) -> std::optional<size_t> {
        if (auto to = dfa.get_transition(s, c)) return state2class.at(*to);
        return {};
    };

    for (const auto& X : P) {
        auto repr = *X.begin();
        for (auto c : alphabet)
            for (auto x : X)
                if (target(x, c) != target(repr, c)) return false;
    }
    return true;
}

Partition hopcroft(const DFA& dfa, const StateSet& states, const Alphabet& alphabet) {
    StateSet F;
    for (auto state : states)
        if (dfa.is_accepting(state)) F.insert(state);

    Partition P;
    for (auto&& X : {states - F, F})
        if (!X.empty()) P.emplace_back(X);

    std::deque<StateSet> W(P.begin(), P.end());
    while (true) {
        while (!W.empty()) {
            auto A = std::move(W.front());
            W.pop_front();
            for (auto c : alphabet) {
                StateSet X;
                for (auto state : states)
                    dfa.node(state).for_transitions(
                        [&](StateId to) {
                            if (A.contains(to)) X.insert(state);
                        },
                        c);
                if (X.empty()) continue;

                Partition newP;
                for (auto& Y : P) {
                    auto YnX = Y * X;
                    auto Y_X = Y - X;
                    if (!YnX.empty() && !Y_X.empty()) {
                        W.push_back(YnX.size() <= Y_X.size() ? YnX : Y_X);
                        newP.emplace_back(std::move(YnX));
                        newP.emplace_back(std::move(Y_X));
                    } else {
                        newP.emplace_back(std::move(Y));
                    }
                }
                std::swap(P, newP);
            }
        }

        // Draining W must have reached the fixpoint; otherwise refine again with every class as splitter.
        if (is_stable(dfa, P, alphabet)) return P;
        W.assign(P.begin(), P.end());
    }
}

} // namespace

namespace remin::automaton {

std::unique_ptr<DFA> minimize_dfa(const DFA& dfa) {
    auto minDfa = std::make_unique<DFA>();
    if (dfa.num_states() == 0) return minDfa;

    const auto states    = get_referenced_states(dfa);
    const auto alphabet  = dfa.get_alphabet();
    const auto P         = hopcroft(dfa, states, alphabet);
    const auto dfaStates = get_classes(P);

    for (const auto& X : P) {
        auto state = minDfa->add_state();
        for (auto x : X)
            if (dfa.is_accepting(x)) minDfa->set_accepting(state);
    }
    minDfa->set_start(dfaStates.at(dfa.get_start()));

    // any representative will do: all members of a class agree on the classes they move to
    for (StateId i = 0, e = P.size(); i != e; ++i)
        dfa.node(*P[i].begin()).for_transitions([&](Symbol c, StateId to) {
            minDfa->add_transition(i, dfaStates.at(to), c);
        });

    return minDfa;
}

std::unique_ptr<DFA> prune_dfa(const DFA& dfa) {
    auto res = std::make_unique<DFA>();
    if (dfa.num_states() == 0) return res;

    const auto alphabet = dfa.get_alphabet();
    absl::flat_hash_map<StateId, StateId> old2new;
    std::queue<StateId> stateQueue;

    auto get_state = [&](StateId old) {
        auto [i, ins] = old2new.try_emplace(old, 0);
        if (ins) {
            i->second = res->add_state();
            res->set_accepting(i->second, dfa.is_accepting(old));
            stateQueue.push(old);
        }
        return i->second;
    };

    res->set_start(get_state(dfa.get_start()));
    while (!stateQueue.empty()) {
        auto old = stateQueue.front();
        stateQueue.pop();
        auto from = old2new.at(old);
        for (auto c : alphabet)
            if (auto to = dfa.get_transition(old, c)) res->add_transition(from, get_state(*to), c);
    }

    return res;
}

} // namespace remin::automaton
