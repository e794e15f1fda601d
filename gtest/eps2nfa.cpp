#include <gtest/gtest.h>

#include "remin/driver.h"

#include "remin/automaton/eps2nfa.h"
#include "remin/automaton/regex2eps.h"

#include "helpers.h"

using namespace remin;
using namespace remin::automaton;

namespace {

const char* patterns[] = {"a", "a+b", "ab", "a*", "(a+b)*c", "(ab+b)*a", "a*b*c*", "((a+b)(a+c))*", "(a*+b)*"};

} // namespace

TEST(Eps2Nfa, Closure) {
    // 0 -ε-> 1 -ε-> 2 -a-> 3 -ε-> 0
    EpsNFA eps;
    for (int i = 0; i < 4; ++i) eps.add_state();
    eps.add_transition(0, 1, Label::eps());
    eps.add_transition(1, 2, Label::eps());
    eps.add_transition(2, 3, Label('a'));
    eps.add_transition(3, 0, Label::eps());

    EXPECT_EQ(eps_closure(eps, 0), (StateSet{0, 1, 2}));
    EXPECT_EQ(eps_closure(eps, 2), StateSet{2});
    EXPECT_EQ(eps_closure(eps, 3), (StateSet{0, 1, 2, 3}));
    EXPECT_EQ(eps_closure(eps, StateSet{1, 3}), (StateSet{0, 1, 2, 3}));
    EXPECT_TRUE(eps_closure(eps, StateSet{}).empty());

    for (StateId s = 0; s != 4; ++s) {
        auto closure = eps_closure(eps, s);
        EXPECT_TRUE(closure.contains(s));
        EXPECT_EQ(eps_closure(eps, closure), closure);
    }

    EXPECT_EQ(move_on(eps, StateSet{0, 1, 2}, 'a'), StateSet{3});
    EXPECT_TRUE(move_on(eps, StateSet{0, 1}, 'a').empty());
    EXPECT_TRUE(move_on(eps, StateSet{0, 1, 2}, 'b').empty());
}

TEST(Eps2Nfa, Star) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("a*"));
    auto nfa = eps2nfa(*eps);

    // {0, 2, 3} and {0, 1, 3}
    ASSERT_EQ(nfa->num_states(), 2u);
    EXPECT_EQ(nfa->get_start(), 0u);
    EXPECT_TRUE(nfa->is_accepting(0));
    EXPECT_TRUE(nfa->is_accepting(1));
    EXPECT_EQ(nfa->node(0).get_transitions('a'), std::vector<StateId>{1});
    EXPECT_EQ(nfa->node(1).get_transitions('a'), std::vector<StateId>{1});
}

TEST(Eps2Nfa, PerState) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("ab"));
    auto nfa = eps2nfa(*eps, Eps2Nfa::PerState);

    // a: 0 -> 1, b: 2 -> 3, 1 -ε-> 2
    ASSERT_EQ(nfa->num_states(), 4u);
    EXPECT_EQ(nfa->get_start(), 0u);
    EXPECT_EQ(nfa->get_accepting_states(), StateSet{3});
    EXPECT_EQ(nfa->node(0).get_transitions('a'), (std::vector<StateId>{1, 2}));
    EXPECT_TRUE(nfa->node(0).get_transitions('b').empty());
    EXPECT_EQ(nfa->node(1).get_transitions('b'), std::vector<StateId>{3});
    EXPECT_EQ(nfa->node(2).get_transitions('b'), std::vector<StateId>{3});
    EXPECT_EQ(nfa->num_transitions(), 4u);
}

TEST(Eps2Nfa, NoEps) {
    for (auto pattern : patterns) {
        Driver driver;
        auto eps = regex2eps(*driver.parse(pattern));
        for (auto strategy : {Eps2Nfa::Merge, Eps2Nfa::PerState}) {
            auto nfa = eps2nfa(*eps, strategy);
            EXPECT_EQ(nfa->get_alphabet(), eps->get_alphabet()) << pattern;
            EXPECT_FALSE(nfa->get_accepting_states().empty()) << pattern;
        }
    }
}

TEST(Eps2Nfa, Language) {
    auto words = gtest::words("abc", 5);
    for (auto pattern : patterns) {
        Driver driver;
        auto eps    = regex2eps(*driver.parse(pattern));
        auto merged = eps2nfa(*eps, Eps2Nfa::Merge);
        auto per    = eps2nfa(*eps, Eps2Nfa::PerState);

        EXPECT_EQ(per->num_states(), eps->num_states()) << pattern;

        for (const auto& word : words) {
            auto expected = accepts(*eps, word);
            EXPECT_EQ(accepts(*merged, word), expected) << pattern << " on " << word;
            EXPECT_EQ(accepts(*per, word), expected) << pattern << " on " << word;
        }
    }
}

TEST(Eps2Nfa, Empty) {
    EpsNFA eps;
    EXPECT_EQ(eps2nfa(eps)->num_states(), 0u);
    EXPECT_EQ(eps2nfa(eps, Eps2Nfa::PerState)->num_states(), 0u);
    EXPECT_FALSE(accepts(eps, ""));
}
