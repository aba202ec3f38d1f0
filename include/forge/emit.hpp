#pragma once

#include "forge/builder.hpp"

#include <nlohmann/json.hpp>
#include <ostream>

namespace forge {

// The catalog in manifest form; loading the result yields an equivalent catalog.
nlohmann::json to_json(const Catalog &catalog);

void emit_dump(std::ostream &out, const Catalog &catalog);

// Graphviz dot. Dependency edges are solid, subsequent edges dashed.
void emit_graph(std::ostream &out, const Catalog &catalog);

} // namespace forge
