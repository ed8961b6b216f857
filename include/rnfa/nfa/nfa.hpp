#pragma once

#include <compare>
#include <cstddef>
#include <map>
#include <queue>
#include <ranges>
#include <set>
#include <string>
#include <variant>

namespace rnfa::nfa {

using StateID = std::size_t;

struct EpsilonTransition {
    auto operator<=>(const EpsilonTransition&) const = default;
};
using Label = std::variant<EpsilonTransition, char>;

using TransitionTable =
    std::map<StateID, std::map<Label, std::set<StateID>>>;

// An automaton with a single start and a single accept state. Every state it
// knows about is a key of `transitions`, even when it has no outgoing edges.
// Destination sets are owned by exactly one NFA.
class NFA {
public:
    NFA(StateID start, StateID accept);

    void add_transition(StateID from, Label label, StateID to);

    // Copies every transition of `other` into this automaton.
    void merge(const NFA& other);
    // Moves every transition of `other` into this automaton, leaving `other`
    // with an empty table.
    void merge(NFA&& other);

    const std::set<StateID>& destinations(StateID from,
                                          const Label& label) const;

    std::size_t state_count() const;
    std::size_t transition_count() const;
    std::size_t symbol_transition_count() const;

    StateID start_state;
    StateID accept_state;
    TransitionTable transitions;
};

std::string to_string(const NFA& nfa);

template <template <class...> class Set, std::ranges::input_range R>
Set<StateID> epsilon_closure(const NFA& nfa, R&& states) {
    Set<StateID> closure(std::ranges::begin(states), std::ranges::end(states));
    std::queue<StateID> processing_queue;
    for (StateID s : closure) {
        processing_queue.push(s);
    }

    while (!processing_queue.empty()) {
        auto current = processing_queue.front();
        processing_queue.pop();

        for (StateID target : nfa.destinations(current, EpsilonTransition{})) {
            if (!closure.contains(target)) {
                closure.insert(target);
                processing_queue.push(target);
            }
        }
    }

    return closure;
}

}  // namespace rnfa::nfa
