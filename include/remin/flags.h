#pragma once

namespace remin {

/// Switches that steer the Driver's pipeline.
/// @see cli/main.cpp
struct Flags {
    bool minimize          = true;  ///< Run the Minimizer after subset construction.
    bool prune_unreachable = false; ///< Drop states unreachable from the start before minimizing.
    bool merge_closures    = true;  ///< Eps2Nfa::Merge; otherwise Eps2Nfa::PerState.
    bool renumber          = false; ///< Renumber the ε-NFA in DFS order before eliminating ε-transitions.
};

} // namespace remin
