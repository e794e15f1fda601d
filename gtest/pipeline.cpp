#include <sstream>

#include <gtest/gtest.h>

#include "remin/driver.h"

#include "remin/automaton/dfamin.h"
#include "remin/automaton/eps2nfa.h"

#include "helpers.h"

using namespace remin;
using namespace remin::automaton;

namespace {

void expect_language(const char* pattern,
                     std::initializer_list<const char*> accept,
                     std::initializer_list<const char*> reject) {
    Driver driver;
    auto automata = driver.compile(pattern);
    ASSERT_TRUE(automata.min);
    for (auto word : accept) EXPECT_TRUE(accepts(*automata.min, word)) << pattern << " should accept '" << word << "'";
    for (auto word : reject) EXPECT_FALSE(accepts(*automata.min, word)) << pattern << " should reject '" << word << "'";
}

/// Every stage must agree with the ε-NFA on all words up to length 5.
void expect_same_language(const Driver::Automata& automata, const char* pattern) {
    for (const auto& word : gtest::words("abc", 5)) {
        auto expected = accepts(*automata.eps, word);
        EXPECT_EQ(accepts(*automata.nfa, word), expected) << pattern << " on '" << word << "'";
        EXPECT_EQ(accepts(*automata.dfa, word), expected) << pattern << " on '" << word << "'";
        if (automata.min) EXPECT_EQ(accepts(*automata.min, word), expected) << pattern << " on '" << word << "'";
    }
}

const char* patterns[]
    = {"a", "a+b", "ab", "a*", "(a+b)*c", "(a+b)*abb", "a*b*", "(ab+ba)*", "((a+b)(a+b))*", "(a+bc)*(c+ab)", "a**"};

} // namespace

TEST(Pipeline, Lit) { expect_language("a", {"a"}, {"", "b", "aa"}); }
TEST(Pipeline, Union) { expect_language("a+b", {"a", "b"}, {"", "ab", "ba"}); }
TEST(Pipeline, Concat) { expect_language("ab", {"ab"}, {"", "a", "b", "aba"}); }
TEST(Pipeline, Star) { expect_language("a*", {"", "a", "aa", "aaa"}, {"b", "ab"}); }
TEST(Pipeline, StarUnionConcat) {
    expect_language("(a+b)*c", {"c", "ac", "bc", "abac", "bbbbc"}, {"", "a", "cc", "cab"});
}

TEST(Pipeline, MinStates) {
    std::vector<std::pair<const char*, size_t>> expected = {
        {"a",         2},
        {"a+b",       2},
        {"ab",        3},
        {"a*",        1},
        {"(a+b)*c",   2},
        {"(a+b)*abb", 4},
        {"a+aa*",     2},
    };

    for (auto [pattern, num] : expected) {
        Driver driver;
        auto automata = driver.compile(pattern);
        EXPECT_EQ(automata.min->num_states(), num) << pattern;
        EXPECT_LE(automata.min->get_reachable_states().size(), automata.dfa->get_reachable_states().size())
            << pattern;
    }
}

TEST(Pipeline, Language) {
    for (auto pattern : patterns) {
        Driver driver;
        auto automata = driver.compile(pattern);
        expect_same_language(automata, pattern);

        auto& min = *automata.min;
        EXPECT_LE(min.num_states(), automata.dfa->num_states()) << pattern;
        EXPECT_LE(automata.dfa->num_states(), size_t(1) << automata.nfa->num_states()) << pattern;
        EXPECT_EQ(minimize_dfa(min)->num_states(), min.num_states()) << pattern;
    }
}

TEST(Pipeline, Flags) {
    for (auto pattern : patterns) {
        Driver driver;
        auto& flags             = driver.flags();
        flags.merge_closures    = false;
        flags.renumber          = true;
        flags.prune_unreachable = true;

        auto automata = driver.compile(pattern);
        EXPECT_EQ(automata.eps->get_start(), 0u) << pattern;
        EXPECT_EQ(automata.nfa->num_states(), automata.eps->num_states()) << pattern;
        EXPECT_EQ(automata.dfa->get_reachable_states().size(), automata.dfa->num_states()) << pattern;
        expect_same_language(automata, pattern);

        // merging ε-closures and pruning doesn't change the minimal automaton
        Driver other;
        EXPECT_EQ(automata.min->num_states(), other.compile(pattern).min->num_states()) << pattern;
    }
}

TEST(Pipeline, NoMinimize) {
    Driver driver;
    driver.flags().minimize = false;
    auto automata           = driver.compile("(a+b)*c");

    EXPECT_FALSE(automata.min);
    EXPECT_EQ(&automata.result(), automata.dfa.get());
    EXPECT_TRUE(accepts(automata.result(), "abc"));
    expect_same_language(automata, "(a+b)*c");
}

TEST(Pipeline, Log) {
    Driver driver;
    std::ostringstream os;
    driver.log().set(&os).set(Log::Level::Verbose);
    driver.compile("a+b");

    auto out = os.str();
    EXPECT_NE(out.find("ε-NFA: 6 states"), std::string::npos);
    EXPECT_NE(out.find("minimal DFA: 2 states"), std::string::npos);
    EXPECT_NE(out.find("'a+b': 2 states"), std::string::npos);

    Driver quiet;
    std::ostringstream info;
    quiet.log().set(&info).set(Log::Level::Info);
    quiet.compile("a+b");
    EXPECT_NE(info.str().find("'a+b': 2 states"), std::string::npos);
    EXPECT_EQ(info.str().find("ε-NFA"), std::string::npos);
}

TEST(Pipeline, Error) {
    Driver driver;
    EXPECT_THROW(driver.compile("(a+b"), Error);
    EXPECT_THROW(driver.compile(""), Error);
}
