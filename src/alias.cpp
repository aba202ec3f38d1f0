#include "forge/alias.hpp"

#include "forge/utility.hpp"

namespace forge {

Result<AliasTable> AliasTable::create(std::vector<Alias> aliases, const RecipeRegistry &registry) {
    AliasTable table;
    for (auto &alias : aliases) {
        if (registry.contains(alias.name)) {
            return fail(ErrorCode::AliasCollision, "Alias `{}` has the same name as a recipe", alias.name);
        }
        if (!registry.contains(alias.target)) {
            return fail(ErrorCode::UnknownAlias, "Alias `{}` has an unknown target `{}`", alias.name, alias.target);
        }
        if (table.targets_.contains(alias.name)) {
            return fail(ErrorCode::AliasCollision, "Alias `{}` is defined more than once", alias.name);
        }
        table.targets_.emplace(std::move(alias.name), std::move(alias.target));
    }
    return table;
}

std::string_view AliasTable::resolve(std::string_view name) const {
    if (auto it = targets_.find(name); it != targets_.end()) {
        return it->second;
    }
    return name;
}

std::vector<std::string_view> AliasTable::aliases_for(std::string_view recipe) const {
    std::vector<std::string_view> out;
    for (const auto &[alias, target] : targets_) {
        if (target == recipe)
            out.push_back(alias);
    }
    return out;
}

} // namespace forge
