// src/core/istate.cpp
#include "core/istate.h"

namespace uctsearch {
namespace core {

std::size_t StatePtrHash::operator()(const StatePtr& state) const {
    if (!state) {
        return 0;
    }
    return static_cast<std::size_t>(state->getHash());
}

bool StatePtrEqual::operator()(const StatePtr& lhs, const StatePtr& rhs) const {
    if (lhs == rhs) {
        return true;
    }
    if (!lhs || !rhs) {
        return false;
    }
    return lhs->equals(*rhs);
}

} // namespace core
} // namespace uctsearch
