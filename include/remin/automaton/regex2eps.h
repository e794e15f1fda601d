#pragma once

#include <memory>

#include "remin/ast/ast.h"
#include "remin/automaton/eps_nfa.h"

namespace remin::automaton {

/// Thompson construction.
/// Every sub-expression becomes a fragment with a single start state without incoming edges and a single accept
/// state without outgoing edges; fragments are glued with ε-transitions only.
/// The result has exactly one accepting state.
std::unique_ptr<EpsNFA> regex2eps(const ast::Expr& regex);

} // namespace remin::automaton
