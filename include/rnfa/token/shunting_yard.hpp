#pragma once

#include <cstddef>
#include <ranges>
#include <stack>
#include <vector>
#include "parse_error.hpp"
#include "token.hpp"

namespace rnfa::token {

// Converts an infix token stream with explicit concatenation into postfix.
// Operators of equal precedence pop before the new one is pushed, so every
// operator is left-associative.
template <std::ranges::input_range R>
std::vector<Token> shunting_yard(R&& tokens) {
    std::vector<Token> output;
    std::stack<Token> op_stack;
    std::stack<std::size_t> open_positions;
    std::size_t position = 0;

    for (auto&& token : tokens) {
        if (std::holds_alternative<GroupOpen>(token)) {
            op_stack.push(token);
            open_positions.push(position);
        } else if (std::holds_alternative<GroupClose>(token)) {
            while (!op_stack.empty() &&
                   !std::holds_alternative<GroupOpen>(op_stack.top())) {
                output.push_back(std::move(op_stack.top()));
                op_stack.pop();
            }

            if (op_stack.empty()) {
                throw MalformedExpressionError(
                    "Unbalanced parentheses: ')' without matching '('",
                    position, ')');
            }

            op_stack.pop();
            open_positions.pop();
        } else if (is_operator(token)) {
            while (!op_stack.empty() &&
                   precedence(op_stack.top()) >= precedence(token)) {
                output.push_back(std::move(op_stack.top()));
                op_stack.pop();
            }

            op_stack.push(token);
        } else {
            output.push_back(token);
        }
        ++position;
    }

    while (!op_stack.empty()) {
        if (std::holds_alternative<GroupOpen>(op_stack.top())) {
            throw MalformedExpressionError(
                "Unbalanced parentheses: '(' never closed",
                open_positions.top(), '(');
        }
        output.push_back(std::move(op_stack.top()));
        op_stack.pop();
    }

    return output;
}

}  // namespace rnfa::token
