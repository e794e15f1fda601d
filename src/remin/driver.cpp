#include "remin/driver.h"

#include "remin/ast/parser.h"
#include "remin/automaton/dfamin.h"
#include "remin/automaton/eps2nfa.h"
#include "remin/automaton/nfa2dfa.h"
#include "remin/automaton/regex2eps.h"

namespace remin {

using namespace automaton;

ast::Ptr<ast::Expr> Driver::parse(std::string_view pattern) {
    auto parser = ast::Parser(ast_);
    auto expr   = parser.parse(pattern, &path_);
    VLOG("parsed '{}' into {} nodes", pattern, expr->num_nodes());
    DLOG("ast: {}", *expr);
    return expr;
}

Driver::Automata Driver::compile(const ast::Expr& regex) const {
    Automata res;

    res.eps = regex2eps(regex);
    if (flags().renumber) res.eps = renumber(*res.eps);
    VLOG("ε-NFA: {} states, {} transitions", res.eps->num_states(), res.eps->num_transitions());
    DLOG("{}", *res.eps);

    res.nfa = eps2nfa(*res.eps, flags().merge_closures ? Eps2Nfa::Merge : Eps2Nfa::PerState);
    VLOG("NFA: {} states, {} transitions", res.nfa->num_states(), res.nfa->num_transitions());
    DLOG("{}", *res.nfa);

    res.dfa = nfa2dfa(*res.nfa);
    if (flags().prune_unreachable) res.dfa = prune_dfa(*res.dfa);
    VLOG("DFA: {} states, {} transitions", res.dfa->num_states(), res.dfa->num_transitions());
    DLOG("{}", *res.dfa);

    if (flags().minimize) {
        res.min = minimize_dfa(*res.dfa);
        VLOG("minimal DFA: {} states, {} transitions", res.min->num_states(), res.min->num_transitions());
        DLOG("{}", *res.min);
    }

    return res;
}

Driver::Automata Driver::compile(std::string_view pattern) {
    auto regex    = parse(pattern);
    auto automata = compile(*regex);
    ILOG("'{}': {} states", pattern, automata.result().num_states());
    return automata;
}

} // namespace remin
