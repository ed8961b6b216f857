#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rnfa::token {

struct Literal {
    char value;
};
struct Concatenation {};
struct Alternation {};
struct KleeneStar {};
struct PositiveClosure {};
struct Optional {};
struct GroupOpen {};
struct GroupClose {};

using Token = std::variant<Literal,
                           Concatenation,
                           Alternation,
                           KleeneStar,
                           PositiveClosure,
                           Optional,
                           GroupOpen,
                           GroupClose>;

namespace detail {

template <typename... Alts, typename... Ts>
constexpr bool holds_any_of(const std::variant<Ts...>& v) noexcept {
    return (std::holds_alternative<Alts>(v) || ...);
}

}  // namespace detail

inline bool is_unary_operator(const Token& token) {
    return detail::holds_any_of<KleeneStar, PositiveClosure, Optional>(token);
}

inline bool is_binary_operator(const Token& token) {
    return detail::holds_any_of<Concatenation, Alternation>(token);
}

inline bool is_operator(const Token& token) {
    return is_unary_operator(token) || is_binary_operator(token);
}

// Binding strength on the operator stack. GroupOpen is the sentinel at 0 and
// literals never reach the stack.
inline int precedence(const Token& token) {
    return std::visit(
        [](auto&& tok) {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, KleeneStar> ||
                          std::is_same_v<T, PositiveClosure> ||
                          std::is_same_v<T, Optional>) {
                return 3;
            } else if constexpr (std::is_same_v<T, Concatenation>) {
                return 2;
            } else if constexpr (std::is_same_v<T, Alternation>) {
                return 1;
            } else {
                return 0;
            }
        },
        token);
}

// The character a token is written as; concatenation is written '.'.
char symbol(const Token& token);

std::string to_string(const std::vector<Token>& tokens);

// Reads the postfix text form, where '.' is concatenation. '(' and ')' are
// kept as group tokens so the evaluator can reject them.
std::vector<Token> parse_postfix(std::string_view postfix);

}  // namespace rnfa::token
