#include "../include/automaton.hpp"
#include "../include/transforms.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace automata;

namespace
{
    auto scenario_dfa() -> Automaton
    {
        Automaton fa;
        fa.add_state("q0");
        fa.add_state("q1");
        fa.add_symbol("a");
        fa.add_symbol("b");
        fa.add_start_state("q0");
        fa.add_accept_state("q1");
        fa.add_transition("q0", "a", "q1");
        fa.add_transition("q0", "b", "q0");
        return fa;
    }

    // q0 -ε-> q1 -a-> q2, q2 accepting
    auto epsilon_nfa() -> Automaton
    {
        Automaton fa;
        fa.add_state("q0");
        fa.add_state("q1");
        fa.add_state("q2");
        fa.add_symbol("a");
        fa.add_start_state("q0");
        fa.add_accept_state("q2");
        fa.add_transition("q0", epsilon, "q1");
        fa.add_transition("q1", "a", "q2");
        return fa;
    }

    // words over {a, b} ending in "ab"
    auto ends_in_ab() -> Automaton
    {
        Automaton fa;
        for (auto s : {"0", "1", "2"})
        {
            fa.add_state(s);
        }
        fa.add_symbol("a");
        fa.add_symbol("b");
        fa.add_start_state("0");
        fa.add_accept_state("2");
        fa.add_transition("0", "a", "0");
        fa.add_transition("0", "b", "0");
        fa.add_transition("0", "a", "1");
        fa.add_transition("1", "b", "2");
        return fa;
    }

    auto all_words(const std::vector<std::string>& symbols, std::size_t max_length)
        -> std::vector<std::vector<std::string>>
    {
        std::vector<std::vector<std::string>> words{{}};
        std::size_t begin = 0;
        for (std::size_t len = 0; len < max_length; ++len)
        {
            const std::size_t end = words.size();
            for (std::size_t i = begin; i < end; ++i)
            {
                for (const auto& sym : symbols)
                {
                    auto longer = words[i];
                    longer.push_back(sym);
                    words.push_back(longer);
                }
            }
            begin = end;
        }
        return words;
    }
}

TEST(Complete, AddsSinkWithSelfLoops)
{
    auto fa = scenario_dfa();
    complete(fa);

    ASSERT_TRUE(fa.has_state("p"));
    EXPECT_FALSE(fa.is_accept("p"));
    EXPECT_EQ(*fa.destinations("p", "a"), StateSet{"p"});
    EXPECT_EQ(*fa.destinations("p", "b"), StateSet{"p"});
    EXPECT_EQ(*fa.destinations("q1", "a"), StateSet{"p"});
    EXPECT_EQ(*fa.destinations("q1", "b"), StateSet{"p"});
    EXPECT_EQ(*fa.destinations("q0", "a"), StateSet{"q1"});
    EXPECT_TRUE(is_complete(fa));
    EXPECT_EQ(classify(fa), "deterministic complete standard");
}

TEST(Complete, LeavesCompleteAutomatonAlone)
{
    auto fa = scenario_dfa();
    fa.add_transition("q1", "a", "q1");
    fa.add_transition("q1", "b", "q1");
    const auto before = fa;
    EXPECT_EQ(complete(fa), before);
}

TEST(Complete, IsIdempotent)
{
    auto once = scenario_dfa();
    complete(once);
    auto twice = once;
    complete(twice);
    EXPECT_EQ(once.transitions(), twice.transitions());
    EXPECT_EQ(once.states(), twice.states());
}

TEST(Complete, EmptyAlphabetAddsNoTransitions)
{
    Automaton fa;
    fa.add_state("q0");
    fa.add_start_state("q0");

    complete(fa);
    EXPECT_TRUE(fa.has_state("p"));
    EXPECT_TRUE(fa.transitions().empty());

    const auto once = fa.transitions();
    complete(fa);
    EXPECT_EQ(fa.transitions(), once);
}

TEST(Complete, SinkNameDoesNotCollide)
{
    auto fa = scenario_dfa();
    fa.add_state("p");
    complete(fa);
    EXPECT_TRUE(fa.has_state("p_1"));
    EXPECT_EQ(*fa.destinations("p", "a"), StateSet{"p_1"});
    EXPECT_TRUE(is_complete(fa));
}

TEST(Standardize, UnionsTransitionsOfAllStartStates)
{
    auto fa = scenario_dfa();
    fa.add_start_state("q1");
    fa.add_transition("q1", "a", "q0");
    EXPECT_FALSE(is_standard(fa));

    standardize(fa);

    ASSERT_EQ(fa.start_states().size(), 1u);
    const auto& start = *fa.start_states().begin();
    EXPECT_EQ(start, "q0_new");
    EXPECT_EQ(*fa.destinations(start, "a"), (StateSet{"q0", "q1"}));
    EXPECT_EQ(*fa.destinations(start, "b"), StateSet{"q0"});

    // the old start states keep their transitions
    EXPECT_EQ(*fa.destinations("q0", "a"), StateSet{"q1"});
    EXPECT_EQ(*fa.destinations("q1", "a"), StateSet{"q0"});
    EXPECT_TRUE(is_standard(fa));
}

TEST(Standardize, LeavesStandardAutomatonAlone)
{
    auto fa = scenario_dfa();
    const auto before = fa;
    EXPECT_EQ(standardize(fa), before);
}

TEST(Standardize, IsIdempotent)
{
    auto fa = scenario_dfa();
    fa.add_start_state("q1");
    standardize(fa);
    const auto starts = fa.start_states();
    standardize(fa);
    EXPECT_EQ(fa.start_states(), starts);
}

TEST(Standardize, KeepsAcceptingTheEmptyWord)
{
    auto fa = scenario_dfa();
    fa.add_start_state("q1");
    ASSERT_TRUE(accepts(fa, {}));

    standardize(fa);

    EXPECT_TRUE(fa.is_accept("q0_new"));
    EXPECT_TRUE(accepts(fa, {}));
}

TEST(Standardize, WithoutStartStatesGivesBareStart)
{
    Automaton fa;
    fa.add_state("q0");
    standardize(fa);
    ASSERT_EQ(fa.start_states().size(), 1u);
    EXPECT_EQ(fa.transitions_from(*fa.start_states().begin()), nullptr);
}

TEST(EpsilonClosure, IsReflexive)
{
    auto fa = epsilon_nfa();
    for (const auto& state : fa.states())
    {
        EXPECT_TRUE(epsilon_closure(fa, state).contains(state));
    }
}

TEST(EpsilonClosure, FollowsChainsAndCycles)
{
    Automaton fa;
    for (auto s : {"a", "b", "c", "d"})
    {
        fa.add_state(s);
    }
    fa.add_transition("a", epsilon, "b");
    fa.add_transition("b", epsilon, "c");
    fa.add_transition("c", epsilon, "a");
    fa.add_transition("c", "x", "d");

    EXPECT_EQ(epsilon_closure(fa, "a"), (StateSet{"a", "b", "c"}));
    EXPECT_EQ(epsilon_closure(fa, "d"), StateSet{"d"});
}

TEST(EpsilonClosure, IsAFixedPoint)
{
    auto fa = epsilon_nfa();
    fa.add_transition("q1", epsilon, "q2");
    const auto closure = epsilon_closure(fa, "q0");
    EXPECT_EQ(epsilon_closure(fa, closure), closure);
}

TEST(Determinize, FollowsEpsilonIntoTheStartState)
{
    const auto dfa = determinize(epsilon_nfa());

    EXPECT_TRUE(is_deterministic(dfa));
    ASSERT_EQ(dfa.start_states(), StateSet{"S0"});
    EXPECT_FALSE(dfa.is_accept("S0"));

    const auto targets = dfa.destinations("S0", "a");
    ASSERT_NE(targets, nullptr);
    ASSERT_EQ(targets->size(), 1u);
    EXPECT_EQ(*targets->begin(), "S1");
    EXPECT_TRUE(dfa.is_accept("S1"));
    EXPECT_TRUE(accepts(dfa, {"a"}));
    EXPECT_FALSE(accepts(dfa, {}));
}

TEST(Determinize, DeterministicInputIsReturnedUnchanged)
{
    const auto fa = scenario_dfa();
    EXPECT_EQ(determinize(fa), fa);
}

TEST(Determinize, NamesSubsetsInDiscoveryOrder)
{
    const auto dfa = determinize(ends_in_ab());

    EXPECT_EQ(dfa.states(), (StateSet{"S0", "S1", "S2"}));
    EXPECT_EQ(dfa.start_states(), StateSet{"S0"});
    EXPECT_EQ(dfa.accept_states(), StateSet{"S2"});
    EXPECT_EQ(*dfa.destinations("S0", "a"), StateSet{"S1"});
    EXPECT_EQ(*dfa.destinations("S0", "b"), StateSet{"S0"});
    EXPECT_EQ(*dfa.destinations("S1", "a"), StateSet{"S1"});
    EXPECT_EQ(*dfa.destinations("S1", "b"), StateSet{"S2"});
    EXPECT_EQ(*dfa.destinations("S2", "a"), StateSet{"S1"});
    EXPECT_EQ(*dfa.destinations("S2", "b"), StateSet{"S0"});
    EXPECT_EQ(classify(dfa), "deterministic complete standard");
}

TEST(Determinize, SeedsFromEveryStartState)
{
    Automaton fa;
    for (auto s : {"x", "y", "fx", "fy"})
    {
        fa.add_state(s);
    }
    fa.add_symbol("a");
    fa.add_symbol("b");
    fa.add_start_state("x");
    fa.add_start_state("y");
    fa.add_accept_state("fx");
    fa.add_accept_state("fy");
    fa.add_transition("x", "a", "fx");
    fa.add_transition("y", "b", "fy");
    fa.add_transition("y", epsilon, "y");

    const auto dfa = determinize(fa);

    EXPECT_TRUE(is_standard(dfa));
    EXPECT_TRUE(accepts(dfa, {"a"}));
    EXPECT_TRUE(accepts(dfa, {"b"}));
    EXPECT_FALSE(accepts(dfa, {"a", "b"}));
}

TEST(Determinize, EmptyTargetsLeaveGaps)
{
    const auto dfa = determinize(epsilon_nfa());
    EXPECT_EQ(dfa.destinations("S1", "a"), nullptr);
    EXPECT_FALSE(is_complete(dfa));

    auto completed = dfa;
    complete(completed);
    EXPECT_TRUE(is_complete(completed));
    EXPECT_TRUE(is_deterministic(completed));
}

TEST(Determinize, PreservesTheLanguage)
{
    auto nfa = ends_in_ab();
    nfa.add_transition("2", epsilon, "0");
    const auto dfa = determinize(nfa);

    ASSERT_TRUE(is_deterministic(dfa));
    for (const auto& word : all_words({"a", "b"}, 6))
    {
        EXPECT_EQ(accepts(nfa, word), accepts(dfa, word));
    }
}

TEST(Accepts, RejectsSymbolsOutsideTheAlphabet)
{
    const auto fa = scenario_dfa();
    EXPECT_TRUE(accepts(fa, {"b", "a"}));
    EXPECT_FALSE(accepts(fa, {"c"}));
    EXPECT_FALSE(accepts(fa, {"a", "a"}));
}
