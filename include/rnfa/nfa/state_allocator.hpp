#pragma once

#include <cstddef>
#include "nfa.hpp"

namespace rnfa::nfa {

// Hands out state IDs for one construction run: 0, 1, 2, ... and never the
// same one twice.
class StateAllocator {
public:
    StateID allocate() { return next_++; }

    std::size_t allocated() const { return next_; }

private:
    StateID next_ = 0;
};

}  // namespace rnfa::nfa
