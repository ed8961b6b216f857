#pragma once

#include "error.hpp"

namespace rnfa {

class ParseError : public Error {
public:
    using Error::Error;
};

// Unbalanced grouping: a ')' without an opener or a '(' never closed.
class MalformedExpressionError : public ParseError {
public:
    using ParseError::ParseError;
};

}  // namespace rnfa
