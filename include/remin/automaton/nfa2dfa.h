#pragma once

#include <memory>

#include "remin/automaton/dfa.h"
#include "remin/automaton/nfa.h"

namespace remin::automaton {

/// Subset construction.
/// DFA state `0` is the subset `{nfa.start}`; further states are numbered in breadth-first discovery order, trying
/// symbols in ascending order.
std::unique_ptr<DFA> nfa2dfa(const NFA& nfa);

} // namespace remin::automaton
