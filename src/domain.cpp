#include "forge/domain.hpp"

#include <algorithm>

namespace forge {

size_t Recipe::min_arguments() const {
    return static_cast<size_t>(std::ranges::count_if(parameters, [](const Parameter &p) { return p.required(); }));
}

std::optional<size_t> Recipe::max_arguments() const {
    if (!parameters.empty() && parameters.back().variadic)
        return std::nullopt;
    return parameters.size();
}

} // namespace forge
