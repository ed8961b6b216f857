#pragma once

#include <string>
#include <string_view>
#include <vector>
#include "token.hpp"

namespace rnfa::token {

std::vector<Token> insert_concatenation(const std::vector<Token>& tokens);

std::string insert_concatenation(std::string_view regex);

}  // namespace rnfa::token
