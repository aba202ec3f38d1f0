#pragma once

#include "forge/domain.hpp"
#include "forge/utility.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace forge {

class RecipeRegistry {
public:
    // Validates names, dependency references, call arity and cycles.
    static Result<RecipeRegistry> create(std::vector<Recipe> recipes);

    const Recipe *find(std::string_view name) const;
    Result<const Recipe *> lookup(std::string_view name) const;

    std::vector<const Recipe *> list(bool include_private) const;

    Result<const Recipe *> default_recipe() const;

    const std::vector<Recipe> &recipes() const {
        return recipes_;
    }
    bool contains(std::string_view name) const {
        return find(name) != nullptr;
    }

private:
    RecipeRegistry() = default;

    Result<void> check_references() const;
    Result<void> check_cycles() const;

    std::vector<Recipe> recipes_;
    std::unordered_map<std::string, size_t, StringHash, std::equal_to<>> index_;
};

} // namespace forge
