#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace forge {

struct Parameter {
    std::string name;
    std::optional<std::string> default_value = std::nullopt;
    bool variadic = false;

    // Variadic parameters may always be left empty.
    bool required() const {
        return !variadic && !default_value.has_value();
    }
};

// A call to another recipe, from the dependency or subsequent list.
struct Dependency {
    std::string name;
    std::vector<std::string> arguments;
};

namespace fragment {
struct Text {
    std::string text;
};
struct Placeholder {
    std::string parameter;
};
} // namespace fragment

using Fragment = std::variant<fragment::Text, fragment::Placeholder>;

struct Line {
    std::string source; // Template text with the `@`/`-` prefixes removed
    bool quiet = false;
    bool ignore_errors = false;
    std::vector<Fragment> fragments;
};

struct Recipe {
    std::string name;
    std::vector<Parameter> parameters;
    std::vector<Dependency> dependencies;
    std::vector<Dependency> subsequents;
    std::vector<std::string> body;
    std::optional<std::string> doc = std::nullopt;
    bool is_private = false;
    bool is_default = false;
    bool quiet = false;

    // Compiled from `body` when the catalog is built.
    std::vector<Line> lines;

    size_t min_arguments() const;
    std::optional<size_t> max_arguments() const; // nullopt = unbounded
};

struct Alias {
    std::string name;
    std::string target;
};

struct Settings {
    std::vector<std::string> shell = {"sh", "-cu"};
    bool quiet = false;
};

} // namespace forge
