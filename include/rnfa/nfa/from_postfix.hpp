#pragma once

#include <string_view>
#include <vector>
#include "error.hpp"
#include "nfa.hpp"
#include "token.hpp"

namespace rnfa {

class BuildError : public Error {
public:
    using Error::Error;
};

// A postfix token that is neither a literal nor a known operator.
class UnexpectedSymbolError : public BuildError {
public:
    using BuildError::BuildError;
};

// An operator without enough operands, or a stream that does not reduce to
// exactly one automaton.
class InvalidPostfixError : public BuildError {
public:
    using BuildError::BuildError;
};

}  // namespace rnfa

namespace rnfa::nfa {

NFA from_postfix(const std::vector<token::Token>& postfix);

NFA from_postfix(std::string_view postfix);

}  // namespace rnfa::nfa
