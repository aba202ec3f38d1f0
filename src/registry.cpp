#include "forge/registry.hpp"

#include "forge/utility.hpp"

#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace forge {

namespace {

std::string arity_text(const Recipe &recipe) {
    size_t min = recipe.min_arguments();
    auto max = recipe.max_arguments();
    if (!max)
        return std::format("at least {}", min);
    if (*max == min)
        return std::format("{}", min);
    return std::format("{} to {}", min, *max);
}

} // namespace

Result<RecipeRegistry> RecipeRegistry::create(std::vector<Recipe> recipes) {
    RecipeRegistry registry;
    registry.recipes_ = std::move(recipes);
    registry.index_.reserve(registry.recipes_.size());

    const Recipe *marked_default = nullptr;
    for (size_t i = 0; i < registry.recipes_.size(); ++i) {
        const Recipe &recipe = registry.recipes_[i];
        if (!registry.index_.emplace(recipe.name, i).second) {
            return fail(ErrorCode::DuplicateRecipe, "Recipe `{}` is defined more than once", recipe.name);
        }
        if (recipe.is_default) {
            if (marked_default) {
                return fail(ErrorCode::DuplicateDefault, "Recipes `{}` and `{}` are both marked default",
                            marked_default->name, recipe.name);
            }
            if (recipe.min_arguments() != 0) {
                return fail(ErrorCode::InvalidParameters,
                            "Default recipe `{}` cannot be run without arguments", recipe.name);
            }
            marked_default = &recipe;
        }
    }

    if (auto res = registry.check_references(); !res)
        return std::unexpected(res.error());
    if (auto res = registry.check_cycles(); !res)
        return std::unexpected(res.error());

    return registry;
}

Result<void> RecipeRegistry::check_references() const {
    for (const auto &recipe : recipes_) {
        for (const auto *calls : {&recipe.dependencies, &recipe.subsequents}) {
            for (const auto &dep : *calls) {
                const Recipe *callee = find(dep.name);
                if (!callee) {
                    return fail(ErrorCode::UnresolvedDependency, "Recipe `{}` has unknown dependency `{}`", recipe.name,
                                dep.name);
                }

                size_t count = dep.arguments.size();
                auto max = callee->max_arguments();
                if (count < callee->min_arguments() || (max && count > *max)) {
                    return fail(ErrorCode::DependencyArity,
                                "Dependency `{}` of recipe `{}` got {} argument(s) but takes {}", dep.name,
                                recipe.name, count, arity_text(*callee));
                }
            }
        }
    }
    return {};
}

Result<void> RecipeRegistry::check_cycles() const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    // Dependencies and subsequents both count as edges.
    std::vector<std::vector<size_t>> edges(recipes_.size());
    for (size_t i = 0; i < recipes_.size(); ++i) {
        for (const auto *calls : {&recipes_[i].dependencies, &recipes_[i].subsequents}) {
            for (const auto &dep : *calls) {
                edges[i].push_back(index_.find(dep.name)->second);
            }
        }
    }

    struct Frame {
        size_t node;
        size_t next_edge;
    };

    std::vector<STATUS> status(recipes_.size(), STATUS::UNSTARTED);
    std::vector<Frame> stack;

    for (size_t root = 0; root < recipes_.size(); ++root) {
        if (status[root] != STATUS::UNSTARTED)
            continue;

        status[root] = STATUS::WORKING;
        stack.push_back({root, 0});

        while (!stack.empty()) {
            Frame &frame = stack.back();
            if (frame.next_edge == edges[frame.node].size()) {
                status[frame.node] = STATUS::FINISHED;
                stack.pop_back();
                continue;
            }

            size_t next = edges[frame.node][frame.next_edge++];
            if (status[next] == STATUS::UNSTARTED) {
                status[next] = STATUS::WORKING;
                stack.push_back({next, 0});
            } else if (status[next] == STATUS::WORKING) {
                // Back-edge: the cycle is the stack suffix starting at `next`.
                std::string path;
                bool on_cycle = false;
                for (const auto &f : stack) {
                    on_cycle = on_cycle || f.node == next;
                    if (on_cycle)
                        path += std::format("{} -> ", recipes_[f.node].name);
                }
                path += recipes_[next].name;
                return fail(ErrorCode::DependencyCycle, "Recipe `{}` has circular dependency: {}",
                            recipes_[next].name, path);
            }
        }
    }
    return {};
}

const Recipe *RecipeRegistry::find(std::string_view name) const {
    if (auto it = index_.find(name); it != index_.end()) {
        return &recipes_[it->second];
    }
    return nullptr;
}

Result<const Recipe *> RecipeRegistry::lookup(std::string_view name) const {
    if (const Recipe *recipe = find(name))
        return recipe;
    return fail(ErrorCode::UnknownRecipe, "Manifest does not contain recipe `{}`", name);
}

std::vector<const Recipe *> RecipeRegistry::list(bool include_private) const {
    std::vector<const Recipe *> out;
    out.reserve(recipes_.size());
    for (const auto &recipe : recipes_) {
        if (include_private || !recipe.is_private)
            out.push_back(&recipe);
    }
    return out;
}

Result<const Recipe *> RecipeRegistry::default_recipe() const {
    for (const auto &recipe : recipes_) {
        if (recipe.is_default)
            return &recipe;
    }
    for (const auto &recipe : recipes_) {
        if (recipe.min_arguments() == 0)
            return &recipe;
    }
    return fail(ErrorCode::NoDefaultRecipe, "No recipe can be run without arguments");
}

} // namespace forge
