#include "from_postfix.hpp"
#include <stack>
#include <string>
#include <utility>
#include "state_allocator.hpp"

namespace rnfa::nfa {

namespace {

template <typename T>
constexpr bool always_false = false;

NFA pop_fragment(std::stack<NFA>& frag_stack) {
    NFA top = std::move(frag_stack.top());
    frag_stack.pop();
    return top;
}

void require_operands(const std::stack<NFA>& frag_stack,
                      std::size_t needed,
                      const char* what,
                      std::size_t position,
                      char symbol) {
    if (frag_stack.size() < needed) {
        throw InvalidPostfixError(std::string("Insufficient operands for ") +
                                      what + " at position " +
                                      std::to_string(position),
                                  position, symbol);
    }
}

void handle_literal(StateAllocator& states,
                    std::stack<NFA>& frag_stack,
                    const token::Literal& tok) {
    const auto start = states.allocate();
    const auto end = states.allocate();
    NFA fragment(start, end);
    fragment.add_transition(start, tok.value, end);
    frag_stack.push(std::move(fragment));
}

void handle_concatenation(std::stack<NFA>& frag_stack, std::size_t position) {
    require_operands(frag_stack, 2, "concatenation", position, '.');
    NFA rhs = pop_fragment(frag_stack);
    NFA lhs = pop_fragment(frag_stack);

    NFA fragment(lhs.start_state, rhs.accept_state);
    fragment.add_transition(lhs.accept_state, EpsilonTransition{},
                            rhs.start_state);
    fragment.merge(std::move(lhs));
    fragment.merge(std::move(rhs));

    frag_stack.push(std::move(fragment));
}

void handle_alternation(StateAllocator& states,
                        std::stack<NFA>& frag_stack,
                        std::size_t position) {
    require_operands(frag_stack, 2, "alternation", position, '|');
    NFA rhs = pop_fragment(frag_stack);
    NFA lhs = pop_fragment(frag_stack);

    const auto new_start = states.allocate();
    const auto new_end = states.allocate();
    NFA fragment(new_start, new_end);

    fragment.add_transition(new_start, EpsilonTransition{}, lhs.start_state);
    fragment.add_transition(new_start, EpsilonTransition{}, rhs.start_state);
    fragment.add_transition(lhs.accept_state, EpsilonTransition{}, new_end);
    fragment.add_transition(rhs.accept_state, EpsilonTransition{}, new_end);
    fragment.merge(std::move(lhs));
    fragment.merge(std::move(rhs));

    frag_stack.push(std::move(fragment));
}

void handle_kleene_star(StateAllocator& states,
                        std::stack<NFA>& frag_stack,
                        std::size_t position) {
    require_operands(frag_stack, 1, "Kleene star", position, '*');
    NFA inner = pop_fragment(frag_stack);

    const auto new_start = states.allocate();
    const auto new_end = states.allocate();
    NFA fragment(new_start, new_end);

    fragment.add_transition(new_start, EpsilonTransition{}, inner.start_state);
    fragment.add_transition(inner.accept_state, EpsilonTransition{},
                            inner.start_state);
    fragment.add_transition(new_start, EpsilonTransition{}, new_end);
    fragment.add_transition(inner.accept_state, EpsilonTransition{}, new_end);
    fragment.merge(std::move(inner));

    frag_stack.push(std::move(fragment));
}

void handle_positive_closure(StateAllocator& states,
                             std::stack<NFA>& frag_stack,
                             std::size_t position) {
    require_operands(frag_stack, 1, "positive closure", position, '+');
    NFA inner = pop_fragment(frag_stack);

    const auto new_start = states.allocate();
    const auto new_end = states.allocate();
    NFA fragment(new_start, new_end);

    fragment.add_transition(new_start, EpsilonTransition{}, inner.start_state);
    fragment.add_transition(inner.accept_state, EpsilonTransition{},
                            inner.start_state);
    fragment.add_transition(inner.accept_state, EpsilonTransition{}, new_end);
    fragment.merge(std::move(inner));

    frag_stack.push(std::move(fragment));
}

void handle_optional(StateAllocator& states,
                     std::stack<NFA>& frag_stack,
                     std::size_t position) {
    require_operands(frag_stack, 1, "optional", position, '?');
    NFA inner = pop_fragment(frag_stack);

    const auto new_start = states.allocate();
    const auto new_end = states.allocate();
    NFA fragment(new_start, new_end);

    fragment.add_transition(new_start, EpsilonTransition{}, inner.start_state);
    fragment.add_transition(inner.accept_state, EpsilonTransition{}, new_end);
    fragment.add_transition(new_start, EpsilonTransition{}, new_end);
    fragment.merge(std::move(inner));

    frag_stack.push(std::move(fragment));
}

}  // namespace

NFA from_postfix(const std::vector<token::Token>& postfix) {
    StateAllocator states;
    std::stack<NFA> frag_stack;

    for (std::size_t position = 0; position < postfix.size(); ++position) {
        std::visit(
            [&](auto&& tok) {
                using T = std::decay_t<decltype(tok)>;

                if constexpr (std::is_same_v<T, token::Literal>) {
                    handle_literal(states, frag_stack, tok);
                } else if constexpr (std::is_same_v<T, token::Concatenation>) {
                    handle_concatenation(frag_stack, position);
                } else if constexpr (std::is_same_v<T, token::Alternation>) {
                    handle_alternation(states, frag_stack, position);
                } else if constexpr (std::is_same_v<T, token::KleeneStar>) {
                    handle_kleene_star(states, frag_stack, position);
                } else if constexpr (std::is_same_v<T,
                                                    token::PositiveClosure>) {
                    handle_positive_closure(states, frag_stack, position);
                } else if constexpr (std::is_same_v<T, token::Optional>) {
                    handle_optional(states, frag_stack, position);
                } else if constexpr (std::is_same_v<T, token::GroupOpen> ||
                                     std::is_same_v<T, token::GroupClose>) {
                    const char c = token::symbol(tok);
                    throw UnexpectedSymbolError(
                        std::string("Unexpected symbol '") + c +
                            "' in postfix expression at position " +
                            std::to_string(position),
                        position, c);
                } else {
                    static_assert(always_false<T>, "Non-exhaustive visitor");
                }
            },
            postfix[position]);
    }

    if (frag_stack.size() != 1) {
        throw InvalidPostfixError(
            frag_stack.empty()
                ? std::string("Invalid postfix expression: no automaton built")
                : "Invalid postfix expression: " +
                      std::to_string(frag_stack.size()) +
                      " fragments remaining",
            postfix.size());
    }

    return pop_fragment(frag_stack);
}

NFA from_postfix(std::string_view postfix) {
    return from_postfix(token::parse_postfix(postfix));
}

}  // namespace rnfa::nfa
