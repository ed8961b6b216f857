#include "nfa.hpp"
#include <utility>

namespace rnfa::nfa {

NFA::NFA(StateID start, StateID accept)
    : start_state(start), accept_state(accept) {
    transitions.try_emplace(start);
    transitions.try_emplace(accept);
}

void NFA::add_transition(StateID from, Label label, StateID to) {
    transitions[from][std::move(label)].insert(to);
    transitions.try_emplace(to);
}

void NFA::merge(const NFA& other) {
    for (const auto& [state, labels] : other.transitions) {
        auto& own = transitions[state];
        for (const auto& [label, targets] : labels) {
            own[label].insert(targets.begin(), targets.end());
        }
    }
}

void NFA::merge(NFA&& other) {
    if (transitions.size() < other.transitions.size()) {
        std::swap(transitions, other.transitions);
    }
    for (auto& [state, labels] : other.transitions) {
        auto& own = transitions[state];
        for (auto& [label, targets] : labels) {
            own[label].merge(targets);
        }
    }
    other.transitions.clear();
}

const std::set<StateID>& NFA::destinations(StateID from,
                                           const Label& label) const {
    static const std::set<StateID> none;

    auto state_it = transitions.find(from);
    if (state_it == transitions.end()) {
        return none;
    }
    auto label_it = state_it->second.find(label);
    return label_it == state_it->second.end() ? none : label_it->second;
}

std::size_t NFA::state_count() const {
    return transitions.size();
}

std::size_t NFA::transition_count() const {
    std::size_t count = 0;
    for (const auto& [state, labels] : transitions) {
        for (const auto& [label, targets] : labels) {
            count += targets.size();
        }
    }
    return count;
}

std::size_t NFA::symbol_transition_count() const {
    std::size_t count = 0;
    for (const auto& [state, labels] : transitions) {
        for (const auto& [label, targets] : labels) {
            if (std::holds_alternative<char>(label)) {
                count += targets.size();
            }
        }
    }
    return count;
}

std::string to_string(const NFA& nfa) {
    std::string out = "Start State: " + std::to_string(nfa.start_state) +
                      "\nAccept State: " + std::to_string(nfa.accept_state) +
                      "\nTransitions:\n";

    for (const auto& [state, labels] : nfa.transitions) {
        for (const auto& [label, targets] : labels) {
            out += "  " + std::to_string(state) + " --";
            if (const char* c = std::get_if<char>(&label)) {
                out += *c;
            } else {
                out += "ε";
            }
            out += "--> [";
            bool first = true;
            for (StateID target : targets) {
                if (!first) {
                    out += ", ";
                }
                out += std::to_string(target);
                first = false;
            }
            out += "]\n";
        }
    }

    return out;
}

}  // namespace rnfa::nfa
