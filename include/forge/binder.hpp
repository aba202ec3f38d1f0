#pragma once

#include "forge/domain.hpp"
#include "forge/resolver.hpp"
#include "forge/utility.hpp"

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace forge {

namespace binding {
struct Fixed {
    std::string value;
};
struct Default {
    std::string value;
};
struct Variadic {
    std::vector<std::string> values;
};
} // namespace binding

using Binding = std::variant<binding::Fixed, binding::Default, binding::Variadic>;

std::string render(const Binding &binding);

struct BoundParameter {
    std::string_view name;
    Binding value;
};

struct RenderedLine {
    std::string command;
    bool quiet = false;
    bool ignore_errors = false;
};

struct BoundCommand {
    const Recipe *recipe;
    std::vector<BoundParameter> parameters;
    std::vector<RenderedLine> lines;

    const Binding *find(std::string_view parameter) const;
};

Result<BoundCommand> bind_arguments(const Recipe &recipe, std::span<const std::string> args);

// Binds every entry of the plan, stopping at the first failure.
Result<std::vector<BoundCommand>> bind_plan(const ExecutionPlan &plan);

} // namespace forge
