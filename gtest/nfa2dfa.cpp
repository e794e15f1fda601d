#include <gtest/gtest.h>

#include "remin/automaton/nfa2dfa.h"

#include "helpers.h"

using namespace remin::automaton;

TEST(Nfa2Dfa, Lit) {
    // 0 -a-> 1
    NFA nfa;
    nfa.add_state();
    nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(1);
    nfa.add_transition(0, 1, 'a');

    auto dfa = nfa2dfa(nfa);
    ASSERT_EQ(dfa->num_states(), 2u);
    EXPECT_EQ(dfa->get_start(), 0u);
    EXPECT_EQ(dfa->get_accepting_states(), StateSet{1});
    EXPECT_EQ(dfa->get_transition(0, 'a'), 1u);
    EXPECT_EQ(dfa->num_transitions(), 1u);
}

TEST(Nfa2Dfa, Union) {
    // 0 -a-> 1, 0 -b-> 2; only 1 accepts
    NFA nfa;
    for (int i = 0; i < 3; ++i) nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(1);
    nfa.add_transition(0, 2, 'b');
    nfa.add_transition(0, 1, 'a');

    auto dfa = nfa2dfa(nfa);
    ASSERT_EQ(dfa->num_states(), 3u);
    // symbols are visited in ascending order
    EXPECT_EQ(dfa->get_transition(0, 'a'), 1u);
    EXPECT_EQ(dfa->get_transition(0, 'b'), 2u);
    EXPECT_EQ(dfa->get_accepting_states(), StateSet{1});
}

TEST(Nfa2Dfa, Concat) {
    // 0 -a-> 1 -b-> 2
    NFA nfa;
    for (int i = 0; i < 3; ++i) nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(2);
    nfa.add_transition(0, 1, 'a');
    nfa.add_transition(1, 2, 'b');

    auto dfa = nfa2dfa(nfa);
    auto s0  = dfa->get_start();
    auto s1  = dfa->get_transition(s0, 'a');
    ASSERT_TRUE(s1);
    auto s2 = dfa->get_transition(*s1, 'b');
    ASSERT_TRUE(s2);
    EXPECT_TRUE(dfa->is_accepting(*s2));
    EXPECT_FALSE(dfa->is_accepting(s0));
    EXPECT_FALSE(dfa->is_accepting(*s1));
}

TEST(Nfa2Dfa, Star) {
    // 0 -a-> 0; 0 accepts
    NFA nfa;
    nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(0);
    nfa.add_transition(0, 0, 'a');

    auto dfa = nfa2dfa(nfa);
    ASSERT_EQ(dfa->num_states(), 1u);
    EXPECT_TRUE(dfa->is_accepting(dfa->get_start()));
    EXPECT_EQ(dfa->get_transition(dfa->get_start(), 'a'), dfa->get_start());
}

TEST(Nfa2Dfa, StarUnionConcat) {
    // (a+b)*c: 0 -a-> 0, 0 -b-> 0, 0 -c-> 1
    NFA nfa;
    nfa.add_state();
    nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(1);
    nfa.add_transition(0, 0, 'a');
    nfa.add_transition(0, 0, 'b');
    nfa.add_transition(0, 1, 'c');

    auto dfa = nfa2dfa(nfa);
    ASSERT_EQ(dfa->num_states(), 2u);
    auto s = dfa->get_start();
    EXPECT_EQ(dfa->get_transition(s, 'a'), s);
    EXPECT_EQ(dfa->get_transition(s, 'b'), s);
    auto t = dfa->get_transition(s, 'c');
    ASSERT_TRUE(t);
    EXPECT_TRUE(dfa->is_accepting(*t));
    EXPECT_EQ(dfa->node(*t).num_transitions(), 0u);
}

TEST(Nfa2Dfa, Subsets) {
    // a*ab: 0 -a-> 0, 0 -a-> 1, 1 -b-> 2
    NFA nfa;
    for (int i = 0; i < 3; ++i) nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(2);
    nfa.add_transition(0, 0, 'a');
    nfa.add_transition(0, 1, 'a');
    nfa.add_transition(1, 2, 'b');

    // {0}, {0, 1}, {2}
    auto dfa = nfa2dfa(nfa);
    ASSERT_EQ(dfa->num_states(), 3u);
    EXPECT_LE(dfa->num_states(), 1u << nfa.num_states());
    EXPECT_EQ(dfa->get_transition(0, 'a'), 1u);
    EXPECT_EQ(dfa->get_transition(1, 'a'), 1u);
    EXPECT_EQ(dfa->get_transition(1, 'b'), 2u);
    EXPECT_FALSE(dfa->get_transition(0, 'b'));
    EXPECT_EQ(dfa->get_accepting_states(), StateSet{2});

    for (const auto& word : remin::gtest::words("ab", 6)) EXPECT_EQ(accepts(*dfa, word), accepts(nfa, word)) << word;
}

TEST(Nfa2Dfa, Unreachable) {
    // state 2 can't be reached; its subset never shows up
    NFA nfa;
    for (int i = 0; i < 3; ++i) nfa.add_state();
    nfa.set_start(0);
    nfa.set_accepting(1);
    nfa.set_accepting(2);
    nfa.add_transition(0, 1, 'a');
    nfa.add_transition(2, 0, 'b');

    auto dfa = nfa2dfa(nfa);
    EXPECT_EQ(dfa->num_states(), 2u);
    EXPECT_EQ(dfa->get_alphabet(), Alphabet{'a'});
}

TEST(Nfa2Dfa, Empty) { EXPECT_EQ(nfa2dfa(NFA())->num_states(), 0u); }
