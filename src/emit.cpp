#include "forge/emit.hpp"

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace forge {

namespace {

using json = nlohmann::json;

json calls_to_json(const std::vector<Dependency> &calls) {
    json out = json::array();
    for (const auto &dep : calls) {
        if (dep.arguments.empty()) {
            out.push_back(dep.name);
        } else {
            out.push_back(json{{"name", dep.name}, {"arguments", dep.arguments}});
        }
    }
    return out;
}

json recipe_to_json(const Recipe &recipe) {
    json params = json::array();
    for (const auto &param : recipe.parameters) {
        json p = {{"name", param.name}};
        if (param.default_value)
            p["default"] = *param.default_value;
        if (param.variadic)
            p["variadic"] = true;
        params.push_back(std::move(p));
    }

    json entry;
    entry["name"] = recipe.name;
    if (recipe.doc)
        entry["doc"] = *recipe.doc;
    entry["parameters"] = std::move(params);
    entry["dependencies"] = calls_to_json(recipe.dependencies);
    entry["subsequents"] = calls_to_json(recipe.subsequents);
    entry["body"] = recipe.body;
    entry["private"] = recipe.is_private;
    entry["default"] = recipe.is_default;
    entry["quiet"] = recipe.quiet;
    return entry;
}

} // namespace

json to_json(const Catalog &catalog) {
    json recipes = json::array();
    for (const auto &recipe : catalog.registry.recipes()) {
        recipes.push_back(recipe_to_json(recipe));
    }

    json aliases = json::object();
    for (const auto &[name, target] : catalog.aliases.entries()) {
        aliases[name] = target;
    }

    json root;
    root["settings"] = json{{"shell", catalog.settings.shell}, {"quiet", catalog.settings.quiet}};
    root["aliases"] = std::move(aliases);
    root["recipes"] = std::move(recipes);
    return root;
}

void emit_dump(std::ostream &out, const Catalog &catalog) {
    out << to_json(catalog).dump(4) << '\n';
}

void emit_graph(std::ostream &out, const Catalog &catalog) {
    const auto &recipes = catalog.registry.recipes();

    out << "digraph forge {\n";
    out << "  rankdir=LR;\n";
    out << "  node [shape=box, style=filled, fontname=\"Helvetica\"];\n";

    for (size_t i = 0; i < recipes.size(); ++i) {
        const auto &recipe = recipes[i];
        std::string color = recipe.is_private ? "0.9 0.9 0.9" : "white";
        out << "  \"" << recipe.name << "\" [fillcolor=\"" << color << "\"];\n";
    }

    for (const auto &recipe : recipes) {
        for (const auto &dep : recipe.dependencies) {
            out << "  \"" << recipe.name << "\" -> \"" << dep.name << "\";\n";
        }
        for (const auto &dep : recipe.subsequents) {
            out << "  \"" << recipe.name << "\" -> \"" << dep.name << "\" [style=dashed];\n";
        }
    }
    out << "}\n";
}

} // namespace forge
