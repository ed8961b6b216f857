#include <gtest/gtest.h>
#include <set>
#include <unordered_set>
#include <vector>
#include "nfa.hpp"
#include "state_allocator.hpp"

namespace rnfa::nfa {
namespace {

TEST(NFATest, ConstructorRegistersStartAndAccept) {
    NFA nfa(3, 7);
    EXPECT_EQ(nfa.start_state, 3u);
    EXPECT_EQ(nfa.accept_state, 7u);
    EXPECT_EQ(nfa.state_count(), 2u);
    EXPECT_EQ(nfa.transition_count(), 0u);
}

TEST(NFATest, AddTransitionCreatesNestedEntries) {
    NFA nfa(0, 1);
    nfa.add_transition(0, 'a', 1);
    nfa.add_transition(0, 'a', 2);
    nfa.add_transition(0, EpsilonTransition{}, 1);

    EXPECT_EQ(nfa.destinations(0, 'a'), (std::set<StateID>{1, 2}));
    EXPECT_EQ(nfa.destinations(0, EpsilonTransition{}), (std::set<StateID>{1}));
    EXPECT_TRUE(nfa.destinations(0, 'b').empty());
    EXPECT_TRUE(nfa.destinations(9, 'a').empty());
    EXPECT_EQ(nfa.state_count(), 3u);
    EXPECT_EQ(nfa.transition_count(), 3u);
    EXPECT_EQ(nfa.symbol_transition_count(), 2u);
}

TEST(NFATest, DuplicateTransitionIsStoredOnce) {
    NFA nfa(0, 1);
    nfa.add_transition(0, 'a', 1);
    nfa.add_transition(0, 'a', 1);
    EXPECT_EQ(nfa.transition_count(), 1u);
}

TEST(NFATest, MergedCopyOwnsItsDestinationSets) {
    NFA source(0, 1);
    source.add_transition(0, 'a', 1);

    NFA target(2, 3);
    target.merge(source);
    EXPECT_EQ(target.destinations(0, 'a'), (std::set<StateID>{1}));

    target.add_transition(0, 'a', 3);
    source.add_transition(0, 'a', 2);

    EXPECT_EQ(source.destinations(0, 'a'), (std::set<StateID>{1, 2}));
    EXPECT_EQ(target.destinations(0, 'a'), (std::set<StateID>{1, 3}));
}

TEST(NFATest, MergeUnionsOverlappingEntries) {
    NFA lhs(0, 1);
    lhs.add_transition(0, EpsilonTransition{}, 1);
    NFA rhs(0, 2);
    rhs.add_transition(0, EpsilonTransition{}, 2);

    lhs.merge(rhs);
    EXPECT_EQ(lhs.destinations(0, EpsilonTransition{}),
              (std::set<StateID>{1, 2}));
    EXPECT_EQ(lhs.start_state, 0u);
    EXPECT_EQ(lhs.accept_state, 1u);
}

TEST(NFATest, MergeByMoveEmptiesTheSource) {
    NFA small(0, 1);
    small.add_transition(0, 'x', 1);

    NFA large(2, 5);
    large.add_transition(2, 'a', 3);
    large.add_transition(3, 'b', 4);
    large.add_transition(4, 'c', 5);

    small.merge(std::move(large));
    EXPECT_EQ(small.start_state, 0u);
    EXPECT_EQ(small.accept_state, 1u);
    EXPECT_EQ(small.state_count(), 6u);
    EXPECT_EQ(small.transition_count(), 4u);
    EXPECT_EQ(small.destinations(3, 'b'), (std::set<StateID>{4}));
    EXPECT_TRUE(large.transitions.empty());
}

TEST(NFATest, EpsilonClosureFollowsOnlyEpsilonMoves) {
    NFA nfa(0, 4);
    nfa.add_transition(0, EpsilonTransition{}, 1);
    nfa.add_transition(1, EpsilonTransition{}, 2);
    nfa.add_transition(2, EpsilonTransition{}, 0);
    nfa.add_transition(2, 'a', 3);
    nfa.add_transition(3, EpsilonTransition{}, 4);

    std::vector<StateID> start{0};
    EXPECT_EQ(epsilon_closure<std::set>(nfa, start),
              (std::set<StateID>{0, 1, 2}));

    std::vector<StateID> after{3};
    EXPECT_EQ(epsilon_closure<std::unordered_set>(nfa, after),
              (std::unordered_set<StateID>{3, 4}));
}

TEST(NFAToStringTest, ListsTransitionsInStateOrder) {
    NFA nfa(2, 3);
    nfa.add_transition(2, EpsilonTransition{}, 0);
    nfa.add_transition(2, EpsilonTransition{}, 3);
    nfa.add_transition(0, 'a', 1);

    EXPECT_EQ(to_string(nfa),
              "Start State: 2\n"
              "Accept State: 3\n"
              "Transitions:\n"
              "  0 --a--> [1]\n"
              "  2 --ε--> [0, 3]\n");
}

TEST(StateAllocatorTest, AllocatesIncreasingIds) {
    StateAllocator states;
    EXPECT_EQ(states.allocated(), 0u);
    EXPECT_EQ(states.allocate(), 0u);
    EXPECT_EQ(states.allocate(), 1u);
    EXPECT_EQ(states.allocate(), 2u);
    EXPECT_EQ(states.allocated(), 3u);
}

TEST(StateAllocatorTest, AllocatorsAreIndependent) {
    StateAllocator first;
    StateAllocator second;
    first.allocate();
    first.allocate();
    EXPECT_EQ(second.allocate(), 0u);
    EXPECT_EQ(first.allocate(), 2u);
}

}  // namespace
}  // namespace rnfa::nfa
