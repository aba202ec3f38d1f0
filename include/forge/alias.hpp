#pragma once

#include "forge/domain.hpp"
#include "forge/registry.hpp"
#include "forge/utility.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

class AliasTable {
public:
    AliasTable() = default;

    static Result<AliasTable> create(std::vector<Alias> aliases, const RecipeRegistry &registry);

    // Returns `name` itself when it is not an alias.
    std::string_view resolve(std::string_view name) const;

    // Aliases naming `recipe`, sorted by alias name.
    std::vector<std::string_view> aliases_for(std::string_view recipe) const;

    const std::map<std::string, std::string, std::less<>> &entries() const {
        return targets_;
    }

private:
    std::map<std::string, std::string, std::less<>> targets_;
};

} // namespace forge
