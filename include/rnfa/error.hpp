#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace rnfa {

// Base of every error thrown while turning an expression into an automaton.
// position() is the index of the offending token in the sequence the failing
// stage was reading; symbol() is that token's character, if there is one.
class Error : public std::runtime_error {
public:
    Error(const std::string& message,
          std::size_t position,
          std::optional<char> symbol = std::nullopt)
        : std::runtime_error(message), position_(position), symbol_(symbol) {}

    std::size_t position() const noexcept { return position_; }
    std::optional<char> symbol() const noexcept { return symbol_; }

private:
    std::size_t position_;
    std::optional<char> symbol_;
};

}  // namespace rnfa
