/*

THIS SOFTWARE IS OPEN SOURCE UNDER THE MIT LICENSE

Copyright 2025 Vincent Maciejewski, & M2 Tech

*/

#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace conduct {

using Args = std::vector<std::any>;

/// A caller-supplied closure. Empty when the call carries no block.
using Block = std::function<std::any(const Args&)>;

using Handler = std::function<std::any(const Args&, const Block&)>;

/**
 * Declared parameter shape of an operation: required parameters, then
 * optional ones, then (if variadic) any number more.
 */
struct Arity {
    std::size_t required = 0;
    std::size_t optional = 0;
    bool variadic = false;

    bool accepts(std::size_t count) const {
        return count >= required && (variadic || count <= required + optional);
    }

    /// "2", "1..3" or "1+"
    std::string describe() const {
        if (variadic) {
            return std::to_string(required) + "+";
        }
        if (optional > 0) {
            return std::to_string(required) + ".." + std::to_string(required + optional);
        }
        return std::to_string(required);
    }
};

/// One entry of an actor's capability table.
struct Operation {
    Arity arity;
    Handler handler;
};

} // namespace conduct
