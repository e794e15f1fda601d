#include <gtest/gtest.h>

#include "remin/driver.h"

#include "remin/automaton/eps2nfa.h"
#include "remin/automaton/regex2eps.h"

#include "helpers.h"

using namespace remin;
using namespace remin::automaton;

namespace {

size_t num_in_edges(const EpsNFA& eps, StateId state) {
    size_t n = 0;
    for (StateId s = 0, e = eps.num_states(); s != e; ++s)
        eps.node(s).for_transitions([&](Label, StateId to) { n += to == state; });
    return n;
}

} // namespace

TEST(Regex2Eps, Lit) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("a"));

    ASSERT_EQ(eps->num_states(), 2u);
    EXPECT_EQ(eps->get_start(), 0u);
    EXPECT_EQ(eps->get_accepting_states(), StateSet{1});
    EXPECT_EQ(eps->node(0).transitions(), (std::vector<std::pair<Label, StateId>>{{Label('a'), 1}}));
    EXPECT_TRUE(eps->node(1).transitions().empty());
}

TEST(Regex2Eps, Concat) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("ab"));

    // a: 0 -> 1, b: 2 -> 3, glued by 1 -ε-> 2
    ASSERT_EQ(eps->num_states(), 4u);
    EXPECT_EQ(eps->get_start(), 0u);
    EXPECT_EQ(eps->get_accepting_states(), StateSet{3});
    EXPECT_EQ(eps->node(0).transitions(), (std::vector<std::pair<Label, StateId>>{{Label('a'), 1}}));
    EXPECT_EQ(eps->node(1).transitions(), (std::vector<std::pair<Label, StateId>>{{Label::eps(), 2}}));
    EXPECT_EQ(eps->node(2).transitions(), (std::vector<std::pair<Label, StateId>>{{Label('b'), 3}}));
}

TEST(Regex2Eps, Union) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("a+b"));

    ASSERT_EQ(eps->num_states(), 6u);
    EXPECT_EQ(eps->get_start(), 4u);
    EXPECT_EQ(eps->get_accepting_states(), StateSet{5});
    EXPECT_EQ(eps->node(4).transitions(),
              (std::vector<std::pair<Label, StateId>>{{Label::eps(), 0}, {Label::eps(), 2}}));
    EXPECT_EQ(eps->node(1).transitions(), (std::vector<std::pair<Label, StateId>>{{Label::eps(), 5}}));
    EXPECT_EQ(eps->node(3).transitions(), (std::vector<std::pair<Label, StateId>>{{Label::eps(), 5}}));
}

TEST(Regex2Eps, Star) {
    Driver driver;
    auto eps = regex2eps(*driver.parse("a*"));

    ASSERT_EQ(eps->num_states(), 4u);
    EXPECT_EQ(eps->get_start(), 2u);
    EXPECT_EQ(eps->get_accepting_states(), StateSet{3});
    EXPECT_EQ(eps->node(2).transitions(),
              (std::vector<std::pair<Label, StateId>>{{Label::eps(), 0}, {Label::eps(), 3}}));
    EXPECT_EQ(eps->node(1).transitions(),
              (std::vector<std::pair<Label, StateId>>{{Label::eps(), 0}, {Label::eps(), 3}}));
    EXPECT_TRUE(accepts(*eps, ""));
    EXPECT_TRUE(accepts(*eps, "aaa"));
    EXPECT_FALSE(accepts(*eps, "b"));
}

TEST(Regex2Eps, Fragments) {
    // pattern, #literals + #unions + #stars
    std::vector<std::pair<const char*, size_t>> patterns = {
        {"a",           1},
        {"abc",         3},
        {"a+b+c",       5},
        {"(a+b)*c",     5},
        {"(ab)*(ba)*",  6},
        {"((a*)*)*",    4},
        {"a(b+c*)d",    6},
    };

    for (auto [pattern, num] : patterns) {
        Driver driver;
        auto eps = regex2eps(*driver.parse(pattern));

        EXPECT_EQ(eps->num_states(), 2 * num) << pattern;
        auto accepting = eps->get_accepting_states();
        ASSERT_EQ(accepting.size(), 1u) << pattern;
        auto accept = *accepting.begin();
        EXPECT_EQ(num_in_edges(*eps, eps->get_start()), 0u) << pattern;
        EXPECT_TRUE(eps->node(accept).transitions().empty()) << pattern;
        EXPECT_EQ(eps->get_reachable_states().size(), eps->num_states()) << pattern;
    }
}

TEST(Regex2Eps, Language) {
    Driver driver;
    auto eps   = regex2eps(*driver.parse("(a+b)*c"));
    auto words = gtest::words("abc", 4);

    for (const auto& word : words) {
        bool expected = !word.empty() && word.back() == 'c' && word.find('c') == word.size() - 1;
        EXPECT_EQ(accepts(*eps, word), expected) << word;
    }
}
