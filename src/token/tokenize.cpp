#include "tokenize.hpp"
#include <string_view>
#include <vector>

namespace rnfa::token {

namespace {

Token classify(char c, bool dot_is_concatenation) {
    switch (c) {
        case '|':
            return Alternation{};
        case '*':
            return KleeneStar{};
        case '+':
            return PositiveClosure{};
        case '?':
            return Optional{};
        case '(':
            return GroupOpen{};
        case ')':
            return GroupClose{};
        case '.':
            if (dot_is_concatenation) {
                return Concatenation{};
            }
            return Literal{c};
        default:
            return Literal{c};
    }
}

}  // namespace

std::vector<Token> tokenize(std::string_view regex) {
    std::vector<Token> tokens;
    tokens.reserve(regex.size());
    for (char c : regex) {
        tokens.push_back(classify(c, false));
    }
    return tokens;
}

std::vector<Token> parse_postfix(std::string_view postfix) {
    std::vector<Token> tokens;
    tokens.reserve(postfix.size());
    for (char c : postfix) {
        tokens.push_back(classify(c, true));
    }
    return tokens;
}

char symbol(const Token& token) {
    return std::visit(
        [](auto&& tok) -> char {
            using T = std::decay_t<decltype(tok)>;
            if constexpr (std::is_same_v<T, Literal>) {
                return tok.value;
            } else if constexpr (std::is_same_v<T, Concatenation>) {
                return '.';
            } else if constexpr (std::is_same_v<T, Alternation>) {
                return '|';
            } else if constexpr (std::is_same_v<T, KleeneStar>) {
                return '*';
            } else if constexpr (std::is_same_v<T, PositiveClosure>) {
                return '+';
            } else if constexpr (std::is_same_v<T, Optional>) {
                return '?';
            } else if constexpr (std::is_same_v<T, GroupOpen>) {
                return '(';
            } else {
                return ')';
            }
        },
        token);
}

std::string to_string(const std::vector<Token>& tokens) {
    std::string result;
    result.reserve(tokens.size());
    for (const auto& tok : tokens) {
        result.push_back(symbol(tok));
    }
    return result;
}

}  // namespace rnfa::token
