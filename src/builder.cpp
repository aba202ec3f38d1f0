#include "forge/builder.hpp"

#include "forge/template.hpp"

#include <algorithm>
#include <string_view>
#include <unordered_set>
#include <variant>

namespace forge {

namespace {

Result<void> check_parameters(const Recipe &recipe) {
    std::unordered_set<std::string_view> seen;
    bool after_default = false;
    for (size_t i = 0; i < recipe.parameters.size(); ++i) {
        const Parameter &param = recipe.parameters[i];
        if (param.name.empty()) {
            return fail(ErrorCode::InvalidParameters, "Recipe `{}` has a parameter without a name", recipe.name);
        }
        if (!is_identifier(param.name)) {
            return fail(ErrorCode::InvalidParameters, "Recipe `{}` has parameter `{}` that is not an identifier",
                        recipe.name, param.name);
        }
        if (!seen.insert(param.name).second) {
            return fail(ErrorCode::InvalidParameters, "Recipe `{}` has duplicate parameter `{}`", recipe.name,
                        param.name);
        }
        if (param.variadic && i + 1 != recipe.parameters.size()) {
            return fail(ErrorCode::InvalidParameters, "Variadic parameter `{}` of recipe `{}` must come last",
                        param.name, recipe.name);
        }
        if (!param.variadic) {
            if (param.default_value) {
                after_default = true;
            } else if (after_default) {
                return fail(ErrorCode::InvalidParameters,
                            "Parameter `{}` of recipe `{}` follows a parameter with a default and has none",
                            param.name, recipe.name);
            }
        }
    }
    return {};
}

} // namespace

Result<const Recipe *> Catalog::resolve(std::string_view name) const {
    return registry.lookup(aliases.resolve(name));
}

Result<void> CatalogBuilder::add_recipe(Recipe &&recipe) {
    if (recipe.name.empty()) {
        return fail(ErrorCode::InvalidParameters, "Recipe without a name");
    }
    if (!is_identifier(recipe.name)) {
        return fail(ErrorCode::InvalidParameters, "Recipe name `{}` is not an identifier", recipe.name);
    }
    if (recipe.name.starts_with('_'))
        recipe.is_private = true;

    if (auto res = check_parameters(recipe); !res)
        return res;

    recipe.lines.clear();
    recipe.lines.reserve(recipe.body.size());
    for (const auto &raw : recipe.body) {
        auto line = compile_line(raw);
        if (!line) {
            return fail(line.error().code, "Recipe `{}`: {}", recipe.name, line.error().message);
        }

        for (const auto &frag : line->fragments) {
            const auto *placeholder = std::get_if<fragment::Placeholder>(&frag);
            if (!placeholder)
                continue;
            bool declared = std::ranges::any_of(
                recipe.parameters, [&](const Parameter &p) { return p.name == placeholder->parameter; });
            if (!declared) {
                return fail(ErrorCode::UnresolvedPlaceholder, "Recipe `{}` uses undeclared parameter `{}`",
                            recipe.name, placeholder->parameter);
            }
        }
        recipe.lines.push_back(std::move(*line));
    }

    recipes_.push_back(std::move(recipe));
    return {};
}

Result<Catalog> CatalogBuilder::build() && {
    auto registry = RecipeRegistry::create(std::move(recipes_));
    if (!registry)
        return std::unexpected(registry.error());

    auto aliases = AliasTable::create(std::move(aliases_), *registry);
    if (!aliases)
        return std::unexpected(aliases.error());

    return Catalog{std::move(*registry), std::move(*aliases), std::move(settings_)};
}

} // namespace forge
