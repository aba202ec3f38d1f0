#include "forge/listing.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

namespace {

std::string quoted(std::string_view text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\')
            out += '\\';
        out += c;
    }
    return out + '"';
}

std::string call_text(const Dependency &dep) {
    if (dep.arguments.empty())
        return dep.name;
    std::string out = "(" + dep.name;
    for (const auto &arg : dep.arguments) {
        out += " " + quoted(arg);
    }
    return out + ")";
}

std::string alias_note(const std::vector<std::string_view> &aliases) {
    if (aliases.empty())
        return {};
    std::string out = aliases.size() == 1 ? "[alias: " : "[aliases: ";
    for (size_t i = 0; i < aliases.size(); ++i) {
        if (i != 0)
            out += ", ";
        out += aliases[i];
    }
    return out + "]";
}

std::vector<std::string_view> visible_aliases(const Catalog &catalog, std::string_view recipe) {
    auto aliases = catalog.aliases.aliases_for(recipe);
    std::erase_if(aliases, [](std::string_view a) { return a.starts_with('_'); });
    return aliases;
}

} // namespace

std::string signature(const Recipe &recipe) {
    std::string out = recipe.name;
    for (const auto &param : recipe.parameters) {
        out += ' ';
        if (param.variadic)
            out += '*';
        out += param.name;
        if (param.default_value)
            out += std::format("='{}'", *param.default_value);
    }
    return out;
}

void list_recipes(std::ostream &out, const Catalog &catalog) {
    struct Row {
        std::string signature;
        std::string comment;
    };

    std::vector<Row> rows;
    for (const Recipe *recipe : catalog.registry.list(false)) {
        std::string comment = recipe->doc.value_or("");
        std::string note = alias_note(visible_aliases(catalog, recipe->name));
        if (!note.empty())
            comment += comment.empty() ? note : " " + note;
        rows.push_back({signature(*recipe), std::move(comment)});
    }

    size_t width = 0;
    for (const auto &row : rows) {
        if (!row.comment.empty())
            width = std::max(width, row.signature.size());
    }

    std::println(out, "Available recipes:");
    for (const auto &row : rows) {
        if (row.comment.empty())
            std::println(out, "    {}", row.signature);
        else
            std::println(out, "    {:<{}} # {}", row.signature, width, row.comment);
    }
}

void list_summary(std::ostream &out, const Catalog &catalog) {
    std::string line;
    for (const Recipe *recipe : catalog.registry.list(false)) {
        if (!line.empty())
            line += ' ';
        line += recipe->name;
    }
    std::println(out, "{}", line);
}

void show_recipe(std::ostream &out, const Catalog &catalog, const Recipe &recipe) {
    if (recipe.doc)
        std::println(out, "# {}", *recipe.doc);
    for (auto alias : catalog.aliases.aliases_for(recipe.name)) {
        std::println(out, "alias {} := {}", alias, recipe.name);
    }

    std::string header = signature(recipe) + ":";
    for (const auto &dep : recipe.dependencies) {
        header += " " + call_text(dep);
    }
    if (!recipe.subsequents.empty()) {
        header += " &&";
        for (const auto &dep : recipe.subsequents) {
            header += " " + call_text(dep);
        }
    }
    std::println(out, "{}", header);

    for (const auto &line : recipe.body) {
        std::println(out, "    {}", line);
    }
}

} // namespace forge
