#include "forge/invocation.hpp"

#include "forge/binder.hpp"
#include "forge/resolver.hpp"

#if FF_forge__logging
#include <print>
#endif
#include <utility>

namespace forge {

namespace {

#if FF_forge__logging
void trace(Stage stage, std::string_view recipe) {
    std::println(stderr, "[{}] {}", to_string(stage), recipe);
}
#else
void trace(Stage, std::string_view) {
}
#endif

} // namespace

std::string_view to_string(Stage stage) {
    switch (stage) {
    case Stage::Resolving:
        return "resolving";
    case Stage::Planning:
        return "planning";
    case Stage::Binding:
        return "binding";
    case Stage::Executing:
        return "executing";
    case Stage::Succeeded:
        return "succeeded";
    case Stage::Failed:
        return "failed";
    }
    return "unknown";
}

Result<InvocationRequest> make_request(const Catalog &catalog, std::optional<std::string_view> name,
                                       std::vector<std::string> arguments) {
    if (!name) {
        auto recipe = catalog.registry.default_recipe();
        if (!recipe)
            return std::unexpected(recipe.error());
        trace(Stage::Resolving, (*recipe)->name);
        return InvocationRequest{(*recipe)->name, {}};
    }

    trace(Stage::Resolving, *name);
    auto recipe = catalog.resolve(*name);
    if (!recipe)
        return std::unexpected(recipe.error());
    return InvocationRequest{(*recipe)->name, std::move(arguments)};
}

Result<ExecutionPlan> plan(const Catalog &catalog, const InvocationRequest &request) {
    auto root = catalog.registry.lookup(request.recipe_name);
    if (!root)
        return std::unexpected(root.error());

    trace(Stage::Planning, request.recipe_name);
    return plan(catalog.registry, **root, request.arguments);
}

Result<int> invoke(const Catalog &catalog, const InvocationRequest &request, Executor &executor) {
    auto execution_plan = plan(catalog, request);
    if (!execution_plan)
        return std::unexpected(execution_plan.error());

    trace(Stage::Binding, request.recipe_name);
    auto commands = bind_plan(*execution_plan);
    if (!commands)
        return std::unexpected(commands.error());

    trace(Stage::Executing, request.recipe_name);
    auto code = executor.run(*commands);
    if (!code || *code != 0) {
        trace(Stage::Failed, request.recipe_name);
    } else {
        trace(Stage::Succeeded, request.recipe_name);
    }
    return code;
}

} // namespace forge
