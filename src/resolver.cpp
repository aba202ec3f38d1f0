#include "forge/resolver.hpp"

#include <cstdint>
#include <set>
#include <utility>
#if FF_forge__logging
#include <print>
#endif

namespace forge {

ExecutionPlan plan(const RecipeRegistry &registry, const Recipe &root, std::vector<std::string> arguments) {
    enum class PHASE : uint8_t { DEPENDENCIES, SUBSEQUENTS };

    struct Frame {
        PlanEntry entry;
        PHASE phase;
        size_t next;
    };

    ExecutionPlan out;
    // Everything ever pushed; a pair is expanded at most once.
    std::set<std::pair<const Recipe *, std::vector<std::string>>> seen;
    std::vector<Frame> stack;

    seen.emplace(&root, arguments);
    stack.push_back({{&root, std::move(arguments)}, PHASE::DEPENDENCIES, 0});

    while (!stack.empty()) {
        Frame &frame = stack.back();
        const Recipe &recipe = *frame.entry.recipe;
        const auto &calls = frame.phase == PHASE::DEPENDENCIES ? recipe.dependencies : recipe.subsequents;

        if (frame.next == calls.size()) {
            if (frame.phase == PHASE::DEPENDENCIES) {
                out.entries.push_back(frame.entry);
                frame.phase = PHASE::SUBSEQUENTS;
                frame.next = 0;
            } else {
                stack.pop_back();
            }
            continue;
        }

        const Dependency &dep = calls[frame.next++];
        const Recipe *callee = registry.find(dep.name);
        if (!callee) // Registry construction rejects unknown names.
            continue;

        if (seen.emplace(callee, dep.arguments).second) {
            stack.push_back({{callee, dep.arguments}, PHASE::DEPENDENCIES, 0});
        }
#if FF_forge__logging
        else {
            std::println(stderr, "[plan] `{}` already planned, reached again from `{}`", dep.name, recipe.name);
        }
#endif
    }

    return out;
}

} // namespace forge
