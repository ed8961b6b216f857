#pragma once

#include <string_view>
#include <vector>
#include "token.hpp"

namespace rnfa::token {

// Splits an infix expression into tokens. Only * + ? | ( ) are operators;
// every other character, '.' included, is a literal.
std::vector<Token> tokenize(std::string_view regex);

}  // namespace rnfa::token
