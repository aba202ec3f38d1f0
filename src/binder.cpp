#include "forge/binder.hpp"

#include "forge/utility.hpp"

#include <string>
#include <type_traits>
#include <variant>

namespace forge {

namespace {

std::string join(const std::vector<std::string> &values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i != 0)
            out += ' ';
        out += values[i];
    }
    return out;
}

} // namespace

std::string render(const Binding &binding) {
    return std::visit(
        [](const auto &b) -> std::string {
            using T = std::decay_t<decltype(b)>;
            if constexpr (std::is_same_v<T, binding::Variadic>) {
                return join(b.values);
            } else {
                return b.value;
            }
        },
        binding);
}

const Binding *BoundCommand::find(std::string_view parameter) const {
    for (const auto &p : parameters) {
        if (p.name == parameter)
            return &p.value;
    }
    return nullptr;
}

Result<BoundCommand> bind_arguments(const Recipe &recipe, std::span<const std::string> args) {
    BoundCommand out{&recipe, {}, {}};
    out.parameters.reserve(recipe.parameters.size());

    size_t next = 0;
    for (const auto &param : recipe.parameters) {
        if (param.variadic) {
            if (next < args.size()) {
                out.parameters.push_back({param.name, binding::Variadic{{args.begin() + next, args.end()}}});
                next = args.size();
            } else if (param.default_value) {
                out.parameters.push_back({param.name, binding::Default{*param.default_value}});
            } else {
                out.parameters.push_back({param.name, binding::Variadic{}});
            }
            continue;
        }

        if (next < args.size()) {
            out.parameters.push_back({param.name, binding::Fixed{args[next++]}});
        } else if (param.default_value) {
            out.parameters.push_back({param.name, binding::Default{*param.default_value}});
        } else {
            return fail(ErrorCode::MissingArgument, "Recipe `{}` is missing an argument for parameter `{}`",
                        recipe.name, param.name);
        }
    }

    if (next < args.size()) {
        return fail(ErrorCode::TooManyArguments, "Recipe `{}` got {} argument(s) but takes at most {}", recipe.name,
                    args.size(), recipe.parameters.size());
    }

    out.lines.reserve(recipe.lines.size());
    for (const auto &line : recipe.lines) {
        RenderedLine rendered{{}, line.quiet, line.ignore_errors};
        for (const auto &frag : line.fragments) {
            if (const auto *text = std::get_if<fragment::Text>(&frag)) {
                rendered.command += text->text;
            } else {
                const auto &name = std::get<fragment::Placeholder>(frag).parameter;
                const Binding *value = out.find(name);
                if (!value) { // Catalog construction rejects undeclared placeholders.
                    return fail(ErrorCode::UnresolvedPlaceholder, "Recipe `{}` uses undeclared parameter `{}`",
                                recipe.name, name);
                }
                rendered.command += render(*value);
            }
        }
        out.lines.push_back(std::move(rendered));
    }

    return out;
}

Result<std::vector<BoundCommand>> bind_plan(const ExecutionPlan &plan) {
    std::vector<BoundCommand> commands;
    commands.reserve(plan.entries.size());
    for (const auto &entry : plan.entries) {
        auto bound = bind_arguments(*entry.recipe, entry.arguments);
        if (!bound)
            return std::unexpected(bound.error());
        commands.push_back(std::move(*bound));
    }
    return commands;
}

} // namespace forge
