#include <gtest/gtest.h>

#include "remin/automaton/dfamin.h"

#include "helpers.h"

using namespace remin::automaton;

TEST(DFAMin, SingleState) {
    DFA dfa;
    dfa.add_state();
    dfa.set_start(0);
    dfa.set_accepting(0);
    dfa.add_transition(0, 0, 'a');

    auto min = minimize_dfa(dfa);
    ASSERT_EQ(min->num_states(), 1u);
    EXPECT_EQ(min->get_start(), 0u);
    EXPECT_TRUE(min->is_accepting(0));
    EXPECT_EQ(min->get_transition(0, 'a'), 0u);
}

TEST(DFAMin, AlreadyMinimal) {
    // 0 -a-> 1
    DFA dfa;
    dfa.add_state();
    dfa.add_state();
    dfa.set_start(0);
    dfa.set_accepting(1);
    dfa.add_transition(0, 1, 'a');

    auto min = minimize_dfa(dfa);
    ASSERT_EQ(min->num_states(), 2u);
    EXPECT_EQ(min->num_transitions(), 1u);
    EXPECT_EQ(min->get_accepting_states().size(), 1u);
    // non-accepting states come first
    EXPECT_EQ(min->get_start(), 0u);
    EXPECT_EQ(min->get_transition(0, 'a'), 1u);
}

TEST(DFAMin, Redundant) {
    // 0 -a-> 1, 0 -b-> 2; 1 and 2 are both accepting dead ends
    DFA dfa;
    for (int i = 0; i < 3; ++i) dfa.add_state();
    dfa.set_start(0);
    dfa.set_accepting(1);
    dfa.set_accepting(2);
    dfa.add_transition(0, 1, 'a');
    dfa.add_transition(0, 2, 'b');

    auto min = minimize_dfa(dfa);
    ASSERT_EQ(min->num_states(), 2u);
    auto s = min->get_start();
    EXPECT_FALSE(min->is_accepting(s));
    auto t = min->get_transition(s, 'a');
    ASSERT_TRUE(t);
    EXPECT_EQ(min->get_transition(s, 'b'), t);
    EXPECT_TRUE(min->is_accepting(*t));
}

TEST(DFAMin, Split) {
    // ab + bb + ba: after 'a' only 'b' leads on, after 'b' both do
    DFA dfa;
    for (int i = 0; i < 5; ++i) dfa.add_state();
    dfa.set_start(0);
    dfa.add_transition(0, 1, 'a');
    dfa.add_transition(0, 2, 'b');
    dfa.add_transition(1, 3, 'b');
    dfa.add_transition(2, 3, 'a');
    dfa.add_transition(2, 4, 'b');
    dfa.set_accepting(3);
    dfa.set_accepting(4);

    auto min = minimize_dfa(dfa);
    EXPECT_EQ(min->num_states(), 4u);
    for (const auto& word : remin::gtest::words("ab", 4)) EXPECT_EQ(accepts(*min, word), accepts(dfa, word)) << word;
}

TEST(DFAMin, NoAccepting) {
    DFA dfa;
    dfa.add_state();
    dfa.add_state();
    dfa.set_start(0);
    dfa.add_transition(0, 1, 'a');
    dfa.add_transition(1, 0, 'a');

    auto min = minimize_dfa(dfa);
    ASSERT_EQ(min->num_states(), 1u);
    EXPECT_TRUE(min->get_accepting_states().empty());
    EXPECT_EQ(min->get_transition(0, 'a'), 0u);
    EXPECT_FALSE(accepts(*min, ""));
    EXPECT_FALSE(accepts(*min, "aa"));
}

TEST(DFAMin, Unreachable) {
    // 0 -a-> 1; 2 -b-> 2 is unreachable, 3 isn't referenced at all
    DFA dfa;
    for (int i = 0; i < 4; ++i) dfa.add_state();
    dfa.set_start(0);
    dfa.set_accepting(1);
    dfa.add_transition(0, 1, 'a');
    dfa.add_transition(2, 2, 'b');

    auto min = minimize_dfa(dfa);
    EXPECT_EQ(min->num_states(), 3u);
    EXPECT_EQ(min->get_reachable_states().size(), 2u);

    auto pruned = prune_dfa(dfa);
    EXPECT_EQ(pruned->num_states(), 2u);
    EXPECT_EQ(minimize_dfa(*pruned)->num_states(), 2u);
}

TEST(DFAMin, Prune) {
    DFA dfa;
    for (int i = 0; i < 4; ++i) dfa.add_state();
    dfa.set_start(3);
    dfa.add_transition(3, 2, 'b');
    dfa.add_transition(3, 0, 'a');
    dfa.add_transition(0, 3, 'a');
    dfa.add_transition(1, 0, 'a');
    dfa.set_accepting(2);

    auto pruned = prune_dfa(dfa);
    ASSERT_EQ(pruned->num_states(), 3u);
    EXPECT_EQ(pruned->get_start(), 0u);
    EXPECT_EQ(pruned->get_transition(0, 'a'), 1u);
    EXPECT_EQ(pruned->get_transition(0, 'b'), 2u);
    EXPECT_EQ(pruned->get_transition(1, 'a'), 0u);
    EXPECT_EQ(pruned->get_accepting_states(), StateSet{2});
    EXPECT_EQ(pruned->num_transitions(), 3u);

    EXPECT_EQ(prune_dfa(DFA())->num_states(), 0u);
}

TEST(DFAMin, Idempotent) {
    // (a+b)*abb
    DFA dfa;
    for (int i = 0; i < 5; ++i) dfa.add_state();
    dfa.set_start(0);
    dfa.set_accepting(4);
    // clang-format off
    dfa.add_transition(0, 1, 'a'); dfa.add_transition(0, 2, 'b');
    dfa.add_transition(1, 1, 'a'); dfa.add_transition(1, 3, 'b');
    dfa.add_transition(2, 1, 'a'); dfa.add_transition(2, 2, 'b');
    dfa.add_transition(3, 1, 'a'); dfa.add_transition(3, 4, 'b');
    dfa.add_transition(4, 1, 'a'); dfa.add_transition(4, 2, 'b');
    // clang-format on

    auto min = minimize_dfa(dfa);
    EXPECT_EQ(min->num_states(), 4u);
    auto min2 = minimize_dfa(*min);
    EXPECT_EQ(min2->num_states(), min->num_states());
    EXPECT_EQ(min2->get_reachable_states().size(), min->get_reachable_states().size());

    for (const auto& word : remin::gtest::words("ab", 6)) {
        EXPECT_EQ(accepts(*min, word), accepts(dfa, word)) << word;
        EXPECT_EQ(accepts(*min2, word), accepts(dfa, word)) << word;
    }
}

TEST(DFAMin, Empty) { EXPECT_EQ(minimize_dfa(DFA())->num_states(), 0u); }
