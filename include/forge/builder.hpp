#pragma once

#include "forge/alias.hpp"
#include "forge/domain.hpp"
#include "forge/registry.hpp"
#include "forge/utility.hpp"

#include <string_view>
#include <vector>

namespace forge {

// Immutable once built; passed by reference to everything that needs recipes.
struct Catalog {
    RecipeRegistry registry;
    AliasTable aliases;
    Settings settings;

    // Alias resolution followed by a registry lookup.
    Result<const Recipe *> resolve(std::string_view name) const;
};

class CatalogBuilder {
public:
    // Checks the recipe on its own: parameter shape and body templates.
    Result<void> add_recipe(Recipe &&recipe);

    void add_alias(std::string_view name, std::string_view target) {
        aliases_.push_back({std::string(name), std::string(target)});
    }

    Settings &settings() {
        return settings_;
    }
    const std::vector<Recipe> &recipes() const {
        return recipes_;
    }

    // Cross-recipe checks happen here; the builder is consumed.
    Result<Catalog> build() &&;

private:
    std::vector<Recipe> recipes_;
    std::vector<Alias> aliases_;
    Settings settings_;
};

} // namespace forge
