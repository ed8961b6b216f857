#include "regex.hpp"
#include "concatenation.hpp"
#include "shunting_yard.hpp"
#include "tokenize.hpp"

namespace rnfa {

std::string infix_to_postfix(std::string_view regex) {
    return token::to_string(token::shunting_yard(
        token::insert_concatenation(token::tokenize(regex))));
}

nfa::NFA regex_to_nfa(std::string_view regex) {
    return nfa::from_postfix(token::shunting_yard(
        token::insert_concatenation(token::tokenize(regex))));
}

}  // namespace rnfa
