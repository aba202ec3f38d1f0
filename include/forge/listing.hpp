#pragma once

#include "forge/builder.hpp"
#include "forge/domain.hpp"

#include <ostream>
#include <string>

namespace forge {

// `name param='default' *rest`
std::string signature(const Recipe &recipe);

// Non-private recipes in definition order, doc comments aligned in one column.
void list_recipes(std::ostream &out, const Catalog &catalog);

void list_summary(std::ostream &out, const Catalog &catalog);

void show_recipe(std::ostream &out, const Catalog &catalog, const Recipe &recipe);

} // namespace forge
