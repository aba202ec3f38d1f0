#include "forge/parser.hpp"

#include "forge/builder.hpp"
#include "forge/utility.hpp"
#include "mmap.hpp" // Use our internal mmap header

#include <format>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

namespace {

using json = nlohmann::json;

Result<std::string> get_string(const json &node, std::string_view where) {
    if (!node.is_string()) {
        return fail(ErrorCode::MalformedManifest, "{} must be a string", where);
    }
    return node.get<std::string>();
}

Result<bool> get_bool(const json &obj, const char *key, std::string_view where) {
    auto it = obj.find(key);
    if (it == obj.end())
        return false;
    if (!it->is_boolean()) {
        return fail(ErrorCode::MalformedManifest, "{}.{} must be a boolean", where, key);
    }
    return it->get<bool>();
}

Result<std::vector<std::string>> get_strings(const json &node, std::string_view where) {
    if (!node.is_array()) {
        return fail(ErrorCode::MalformedManifest, "{} must be an array of strings", where);
    }
    std::vector<std::string> out;
    out.reserve(node.size());
    for (size_t i = 0; i < node.size(); ++i) {
        auto value = get_string(node[i], std::format("{}[{}]", where, i));
        if (!value)
            return std::unexpected(value.error());
        out.push_back(std::move(*value));
    }
    return out;
}

Result<Parameter> parse_parameter(const json &node, std::string_view where) {
    if (node.is_string()) {
        return Parameter{node.get<std::string>()};
    }
    if (!node.is_object()) {
        return fail(ErrorCode::MalformedManifest, "{} must be a string or an object", where);
    }

    Parameter param;
    auto name = get_string(node.value("name", json()), std::format("{}.name", where));
    if (!name)
        return std::unexpected(name.error());
    param.name = std::move(*name);

    if (auto it = node.find("default"); it != node.end() && !it->is_null()) {
        auto value = get_string(*it, std::format("{}.default", where));
        if (!value)
            return std::unexpected(value.error());
        param.default_value = std::move(*value);
    }

    auto variadic = get_bool(node, "variadic", where);
    if (!variadic)
        return std::unexpected(variadic.error());
    param.variadic = *variadic;
    return param;
}

// "name" or {"name": .., "arguments": [..]}
Result<Dependency> parse_dependency(const json &node, std::string_view where) {
    if (node.is_string()) {
        return Dependency{node.get<std::string>(), {}};
    }
    if (!node.is_object()) {
        return fail(ErrorCode::MalformedManifest, "{} must be a string or an object", where);
    }

    Dependency dep;
    auto name = get_string(node.value("name", json()), std::format("{}.name", where));
    if (!name)
        return std::unexpected(name.error());
    dep.name = std::move(*name);

    if (auto it = node.find("arguments"); it != node.end()) {
        auto args = get_strings(*it, std::format("{}.arguments", where));
        if (!args)
            return std::unexpected(args.error());
        dep.arguments = std::move(*args);
    }
    return dep;
}

Result<std::vector<Dependency>> parse_calls(const json &recipe, const char *key, std::string_view where) {
    std::vector<Dependency> out;
    auto it = recipe.find(key);
    if (it == recipe.end())
        return out;
    if (!it->is_array()) {
        return fail(ErrorCode::MalformedManifest, "{}.{} must be an array", where, key);
    }
    for (size_t i = 0; i < it->size(); ++i) {
        auto dep = parse_dependency((*it)[i], std::format("{}.{}[{}]", where, key, i));
        if (!dep)
            return std::unexpected(dep.error());
        out.push_back(std::move(*dep));
    }
    return out;
}

Result<Recipe> parse_recipe(const json &node, std::string_view where) {
    if (!node.is_object()) {
        return fail(ErrorCode::MalformedManifest, "{} must be an object", where);
    }

    Recipe recipe;
    auto name = get_string(node.value("name", json()), std::format("{}.name", where));
    if (!name)
        return std::unexpected(name.error());
    recipe.name = std::move(*name);

    if (auto it = node.find("doc"); it != node.end() && !it->is_null()) {
        auto doc = get_string(*it, std::format("{}.doc", where));
        if (!doc)
            return std::unexpected(doc.error());
        recipe.doc = std::move(*doc);
    }

    if (auto it = node.find("parameters"); it != node.end()) {
        if (!it->is_array()) {
            return fail(ErrorCode::MalformedManifest, "{}.parameters must be an array", where);
        }
        for (size_t i = 0; i < it->size(); ++i) {
            auto param = parse_parameter((*it)[i], std::format("{}.parameters[{}]", where, i));
            if (!param)
                return std::unexpected(param.error());
            recipe.parameters.push_back(std::move(*param));
        }
    }

    auto deps = parse_calls(node, "dependencies", where);
    if (!deps)
        return std::unexpected(deps.error());
    recipe.dependencies = std::move(*deps);

    auto subs = parse_calls(node, "subsequents", where);
    if (!subs)
        return std::unexpected(subs.error());
    recipe.subsequents = std::move(*subs);

    if (auto it = node.find("body"); it != node.end()) {
        auto body = get_strings(*it, std::format("{}.body", where));
        if (!body)
            return std::unexpected(body.error());
        recipe.body = std::move(*body);
    }

    for (auto [key, flag] : {std::pair{"private", &recipe.is_private}, std::pair{"default", &recipe.is_default},
                             std::pair{"quiet", &recipe.quiet}}) {
        auto value = get_bool(node, key, where);
        if (!value)
            return std::unexpected(value.error());
        *flag = *value;
    }
    return recipe;
}

Result<void> parse_settings(const json &node, Settings &settings) {
    if (!node.is_object()) {
        return fail(ErrorCode::MalformedManifest, "settings must be an object");
    }
    if (auto it = node.find("shell"); it != node.end()) {
        auto shell = get_strings(*it, "settings.shell");
        if (!shell)
            return std::unexpected(shell.error());
        if (shell->empty()) {
            return fail(ErrorCode::MalformedManifest, "settings.shell must name a program");
        }
        settings.shell = std::move(*shell);
    }
    auto quiet = get_bool(node, "quiet", "settings");
    if (!quiet)
        return std::unexpected(quiet.error());
    settings.quiet = *quiet;
    return {};
}

} // namespace

Result<void> parse_manifest(CatalogBuilder &builder, std::string_view content) {
    json root = json::parse(content, nullptr, false);
    if (root.is_discarded()) {
        return fail(ErrorCode::MalformedManifest, "Manifest is not valid JSON");
    }
    if (!root.is_object()) {
        return fail(ErrorCode::MalformedManifest, "Manifest must be a JSON object");
    }

    if (auto it = root.find("settings"); it != root.end()) {
        if (auto res = parse_settings(*it, builder.settings()); !res)
            return res;
    }

    if (auto it = root.find("recipes"); it != root.end()) {
        if (!it->is_array()) {
            return fail(ErrorCode::MalformedManifest, "recipes must be an array");
        }
        for (size_t i = 0; i < it->size(); ++i) {
            auto recipe = parse_recipe((*it)[i], std::format("recipes[{}]", i));
            if (!recipe)
                return std::unexpected(recipe.error());
            if (auto res = builder.add_recipe(std::move(*recipe)); !res)
                return res;
        }
    }

    if (auto it = root.find("aliases"); it != root.end()) {
        if (!it->is_object()) {
            return fail(ErrorCode::MalformedManifest, "aliases must be an object");
        }
        for (const auto &[name, target] : it->items()) {
            auto value = get_string(target, std::format("aliases.{}", name));
            if (!value)
                return std::unexpected(value.error());
            builder.add_alias(name, *value);
        }
    }
    return {};
}

Result<void> parse(CatalogBuilder &builder, const std::filesystem::path &path) {
    auto file = MappedFile::open(path);
    if (!file)
        return std::unexpected(file.error());

    if (auto res = parse_manifest(builder, file->content()); !res) {
        return fail(res.error().code, "{}: {}", path.string(), res.error().message);
    }
    return {};
}

} // namespace forge
