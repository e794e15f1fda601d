#pragma once

#include <memory>

#include "remin/automaton/dfa.h"

namespace remin::automaton {

/// Merges indistinguishable states by partition refinement (Hopcroft).
/// Works on all states referenced by @p dfa: the start, the accepting states, and every transition's source and
/// target. States unreachable from the start are **not** removed; use prune_dfa beforehand if you need a strictly
/// minimal automaton.
/// State `i` of the result is the `i`-th equivalence class.
std::unique_ptr<DFA> minimize_dfa(const DFA& dfa);

/// Drops all states of @p dfa that are unreachable from its start; the remaining ones are renumbered in
/// breadth-first order with the start becoming `0`.
std::unique_ptr<DFA> prune_dfa(const DFA& dfa);

} // namespace remin::automaton
