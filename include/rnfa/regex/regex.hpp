#pragma once

#include <string>
#include <string_view>
#include "from_postfix.hpp"
#include "nfa.hpp"
#include "parse_error.hpp"

namespace rnfa {

// Makes concatenation explicit and rewrites the expression in postfix, with
// concatenation written as '.'.
std::string infix_to_postfix(std::string_view regex);

// Builds an automaton accepting the language of `regex` by Thompson's
// construction. Throws MalformedExpressionError, UnexpectedSymbolError or
// InvalidPostfixError; never returns a partial automaton.
nfa::NFA regex_to_nfa(std::string_view regex);

}  // namespace rnfa
