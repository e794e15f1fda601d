#include <sstream>

#include <gtest/gtest.h>

#include "remin/automaton/dfa.h"
#include "remin/automaton/dfamin.h"
#include "remin/automaton/eps_nfa.h"
#include "remin/automaton/nfa.h"

using namespace remin::automaton;

TEST(Automaton, Label) {
    EXPECT_TRUE(Label().is_eps());
    EXPECT_TRUE(Label::eps().is_eps());
    EXPECT_FALSE(Label('a').is_eps());
    EXPECT_EQ(Label('a').sym(), 'a');
    EXPECT_EQ(Label('a'), Label('a'));
    EXPECT_NE(Label('a'), Label('b'));
    EXPECT_NE(Label('\0'), Label::eps());

    std::ostringstream os;
    os << Label::eps() << ' ' << Label('x') << ' ' << Label('"');
    EXPECT_EQ(os.str(), "ε x \\\"");
}

TEST(Automaton, NFA) {
    NFA nfa;
    auto start = nfa.add_state();
    nfa.set_start(start);
    auto second = nfa.add_state();
    nfa.add_transition(start, second, 'a');
    nfa.add_transition(start, second, 'b');
    nfa.add_transition(second, second, 'b');
    auto third = nfa.add_state();
    nfa.set_accepting(third);
    nfa.add_transition(second, third, 'a');
    nfa.add_transition(third, third, 'a');
    nfa.add_transition(third, second, 'b');
    nfa.add_transition(third, second, 'b'); // duplicate

    EXPECT_EQ(start, 0u);
    EXPECT_EQ(second, 1u);
    EXPECT_EQ(third, 2u);
    EXPECT_EQ(nfa.num_states(), 3u);
    EXPECT_EQ(nfa.num_transitions(), 6u);
    EXPECT_EQ(nfa.get_start(), start);
    EXPECT_FALSE(nfa.is_accepting(start));
    EXPECT_TRUE(nfa.is_accepting(third));
    EXPECT_EQ(nfa.node(start).get_transitions('a'), std::vector<StateId>{second});
    EXPECT_EQ(nfa.node(start).get_transitions('b'), std::vector<StateId>{second});
    EXPECT_EQ(nfa.node(second).get_transitions('a'), std::vector<StateId>{third});
    EXPECT_EQ(nfa.node(second).get_transitions('b'), std::vector<StateId>{second});
    EXPECT_EQ(nfa.node(third).get_transitions('a'), std::vector<StateId>{third});
    EXPECT_EQ(nfa.node(third).get_transitions('b'), std::vector<StateId>{second});
    EXPECT_TRUE(nfa.node(third).get_transitions('c').empty());

    EXPECT_EQ(nfa.get_accepting_states(), StateSet{third});
    EXPECT_EQ(nfa.get_alphabet(), (Alphabet{'a', 'b'}));

    EXPECT_TRUE(accepts(nfa, "aa"));
    EXPECT_TRUE(accepts(nfa, "babbaa"));
    EXPECT_FALSE(accepts(nfa, ""));
    EXPECT_FALSE(accepts(nfa, "ab"));
    EXPECT_FALSE(accepts(nfa, "aac"));
}

TEST(Automaton, NonDeterministicNFA) {
    // a*ab
    NFA nfa;
    for (int i = 0; i < 3; ++i) nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(2);
    nfa.add_transition(0, 0, 'a');
    nfa.add_transition(0, 1, 'a');
    nfa.add_transition(1, 2, 'b');

    EXPECT_EQ(nfa.node(0).get_transitions('a'), (std::vector<StateId>{0, 1}));
    EXPECT_TRUE(accepts(nfa, "ab"));
    EXPECT_TRUE(accepts(nfa, "aaab"));
    EXPECT_FALSE(accepts(nfa, "b"));
    EXPECT_FALSE(accepts(nfa, "aba"));
}

TEST(Automaton, Reachable) {
    NFA nfa;
    for (int i = 0; i < 5; ++i) nfa.add_state();
    nfa.set_start(1);
    nfa.add_transition(1, 3, 'a');
    nfa.add_transition(3, 1, 'b');
    nfa.add_transition(3, 4, 'c');
    nfa.add_transition(0, 2, 'a');

    EXPECT_EQ(nfa.get_reachable_states(), (StateSet{1, 3, 4}));
    EXPECT_TRUE(NFA().get_reachable_states().empty());
}

TEST(Automaton, DFA) {
    DFA dfa;
    auto start = dfa.add_state();
    dfa.set_start(start);
    auto second = dfa.add_state();
    dfa.add_transition(start, second, 'a');
    dfa.add_transition(start, second, 'b');
    dfa.add_transition(second, second, 'b');
    auto third = dfa.add_state();
    dfa.set_accepting(third);
    dfa.add_transition(second, third, 'a');
    dfa.add_transition(third, third, 'a');
    dfa.add_transition(third, second, 'b');

    EXPECT_EQ(dfa.get_start(), start);
    EXPECT_FALSE(dfa.is_accepting(start));
    EXPECT_TRUE(dfa.is_accepting(third));
    EXPECT_EQ(dfa.get_transition(start, 'a'), second);
    EXPECT_EQ(dfa.get_transition(start, 'b'), second);
    EXPECT_EQ(dfa.get_transition(second, 'a'), third);
    EXPECT_EQ(dfa.get_transition(second, 'b'), second);
    EXPECT_EQ(dfa.get_transition(third, 'a'), third);
    EXPECT_EQ(dfa.get_transition(third, 'b'), second);
    EXPECT_FALSE(dfa.get_transition(third, 'c'));

    // overwrites
    dfa.add_transition(third, start, 'b');
    EXPECT_EQ(dfa.get_transition(third, 'b'), start);
    EXPECT_EQ(dfa.node(third).num_transitions(), 2u);

    EXPECT_TRUE(accepts(dfa, "aa"));
    EXPECT_TRUE(accepts(dfa, "bbbba"));
    EXPECT_FALSE(accepts(dfa, "a"));
    EXPECT_FALSE(accepts(dfa, "aab"));
    EXPECT_FALSE(accepts(dfa, "ac"));
    EXPECT_FALSE(accepts(DFA(), ""));
}

TEST(Automaton, DFAMin) {
    // DFA for (a+b)+a
    DFA dfa;
    auto start = dfa.add_state();
    dfa.set_start(start);
    auto stateB = dfa.add_state();
    dfa.add_transition(start, stateB, 'a');
    auto stateC = dfa.add_state();
    dfa.add_transition(start, stateC, 'b');
    auto stateD = dfa.add_state();
    dfa.set_accepting(stateD);
    dfa.add_transition(stateB, stateD, 'a');
    dfa.add_transition(stateC, stateD, 'a');
    dfa.add_transition(stateD, stateD, 'a');
    auto stateE = dfa.add_state();
    dfa.add_transition(stateB, stateE, 'b');
    dfa.add_transition(stateC, stateE, 'b');
    dfa.add_transition(stateD, stateE, 'b');
    dfa.add_transition(stateE, stateE, 'b');
    dfa.add_transition(stateE, stateD, 'a');

    auto min_dfa = minimize_dfa(dfa);
    EXPECT_EQ(min_dfa->num_states(), 3u);

    auto min_start = min_dfa->get_start();
    EXPECT_FALSE(min_dfa->is_accepting(min_start));

    auto min_stateB = min_dfa->get_transition(min_start, 'a');
    ASSERT_TRUE(min_stateB);
    EXPECT_EQ(min_dfa->get_transition(min_start, 'b'), min_stateB);
    EXPECT_NE(*min_stateB, min_start);

    auto min_stateC = min_dfa->get_transition(*min_stateB, 'a');
    ASSERT_TRUE(min_stateC);
    EXPECT_EQ(min_dfa->get_transition(*min_stateB, 'b'), min_stateB);

    EXPECT_TRUE(min_dfa->is_accepting(*min_stateC));
    EXPECT_EQ(min_dfa->get_transition(*min_stateC, 'a'), min_stateC);
    EXPECT_EQ(min_dfa->get_transition(*min_stateC, 'b'), min_stateB);
}

TEST(Automaton, Renumber) {
    EpsNFA eps;
    for (int i = 0; i < 5; ++i) eps.add_state();
    eps.set_start(3);
    eps.set_accepting(0);
    eps.add_transition(3, 1, Label::eps());
    eps.add_transition(3, 4, Label('b'));
    eps.add_transition(1, 0, Label('a'));
    eps.add_transition(2, 0, Label('c')); // unreachable

    auto res = renumber(eps);
    ASSERT_EQ(res->num_states(), 4u);
    EXPECT_EQ(res->get_start(), 0u);
    // 3 -> 0; then the edges of 3 are discovered back to front: 4 -> 1, 1 -> 2; finally 0 -> 3
    EXPECT_EQ(res->node(0).transitions(), (std::vector<std::pair<Label, StateId>>{{Label::eps(), 2}, {Label('b'), 1}}));
    EXPECT_EQ(res->node(2).transitions(), (std::vector<std::pair<Label, StateId>>{{Label('a'), 3}}));
    EXPECT_TRUE(res->node(1).transitions().empty());
    EXPECT_TRUE(res->node(3).transitions().empty());
    EXPECT_EQ(res->get_accepting_states(), StateSet{3});
    EXPECT_EQ(res->get_alphabet(), (Alphabet{'a', 'b'}));
}

TEST(Automaton, Dot) {
    DFA dfa;
    dfa.add_state();
    dfa.add_state();
    dfa.add_transition(0, 1, 'a');
    dfa.set_accepting(1);

    std::ostringstream os;
    os << dfa;
    EXPECT_EQ(os.str(), "digraph dfa {\n"
                        "  rankdir=LR;\n"
                        "  node [shape=circle];\n"
                        "  start [shape=point];\n"
                        "  start -> 0;\n"
                        "  0 -> 1 [label=\"a\"];\n"
                        "  1 [shape=doublecircle];\n"
                        "}\n");

    EpsNFA eps;
    eps.add_state();
    eps.add_state();
    eps.add_transition(0, 1, Label::eps());
    eps.add_transition(1, 0, Label('"'));

    std::ostringstream eos;
    eos << eps;
    EXPECT_EQ(eos.str(), "digraph eps_nfa {\n"
                         "  rankdir=LR;\n"
                         "  node [shape=circle];\n"
                         "  start [shape=point];\n"
                         "  start -> 0;\n"
                         "  0 -> 1 [label=\"ε\"];\n"
                         "  1 -> 0 [label=\"\\\"\"];\n"
                         "}\n");
}
