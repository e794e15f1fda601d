#pragma once

#include <memory>
#include <string_view>

#include "remin/automaton/eps_nfa.h"
#include "remin/automaton/nfa.h"

namespace remin::automaton {

/// @name ε-closure
///@{
/// All states reachable from @p state via ε-transitions only; always contains @p state.
StateSet eps_closure(const EpsNFA& eps, StateId state);
/// Union of the ε-closures of all @p states, computed in a single traversal.
StateSet eps_closure(const EpsNFA& eps, const StateSet& states);
///@}

/// All states reachable from @p states via exactly one transition on @p c; ε-transitions do not participate.
StateSet move_on(const EpsNFA& eps, const StateSet& states, Symbol c);

/// Simulates @p eps on @p input with ε-closed sets of active states.
bool accepts(const EpsNFA& eps, std::string_view input);

enum class Eps2Nfa {
    Merge,    ///< One NFA state per distinct ε-closure reachable from the start.
    PerState, ///< One NFA state per state of the ε-NFA; keeps all StateId%s.
};

/// Removes all ε-transitions of @p eps without changing its language.
std::unique_ptr<NFA> eps2nfa(const EpsNFA& eps, Eps2Nfa strategy = Eps2Nfa::Merge);

} // namespace remin::automaton
