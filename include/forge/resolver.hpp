#pragma once

#include "forge/domain.hpp"
#include "forge/registry.hpp"

#include <string>
#include <vector>

namespace forge {

struct PlanEntry {
    const Recipe *recipe;
    std::vector<std::string> arguments;

    bool operator==(const PlanEntry &other) const {
        return recipe == other.recipe && arguments == other.arguments;
    }
};

struct ExecutionPlan {
    std::vector<PlanEntry> entries;

    bool operator==(const ExecutionPlan &) const = default;
};

/**
 * @brief Orders `root` and everything it reaches for execution.
 *
 * Post-order walk over dependency edges: every dependency is placed before the recipe naming it,
 * siblings keep their declaration order, and subsequents follow the recipe that lists them.
 * A (recipe, arguments) pair is placed at most once.
 *
 * @param registry A validated registry; `root` must belong to it.
 * @param root The requested recipe.
 * @param arguments Caller arguments for `root`. Dependencies get their call-site arguments.
 */
ExecutionPlan plan(const RecipeRegistry &registry, const Recipe &root, std::vector<std::string> arguments);

} // namespace forge
