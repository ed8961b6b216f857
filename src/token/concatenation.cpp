#include "concatenation.hpp"
#include "tokenize.hpp"

namespace rnfa::token {

namespace {

// Whether a token can be the left side of an implicit concatenation: a
// literal, a ')' or a repetition result.
bool can_end_operand(const Token& token) {
    return !detail::holds_any_of<GroupOpen, Alternation, Concatenation>(token);
}

// Whether a token can be the right side: a literal or a '('.
bool can_start_operand(const Token& token) {
    return !detail::holds_any_of<GroupClose, Alternation, Concatenation,
                                 KleeneStar, PositiveClosure, Optional>(token);
}

}  // namespace

std::vector<Token> insert_concatenation(const std::vector<Token>& tokens) {
    std::vector<Token> explicit_tokens;
    explicit_tokens.reserve(tokens.size() * 2);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        explicit_tokens.push_back(tokens[i]);
        if (i + 1 < tokens.size() && can_end_operand(tokens[i]) &&
            can_start_operand(tokens[i + 1])) {
            explicit_tokens.push_back(Concatenation{});
        }
    }

    return explicit_tokens;
}

std::string insert_concatenation(std::string_view regex) {
    return to_string(insert_concatenation(tokenize(regex)));
}

}  // namespace rnfa::token
