#include "forge/builder.hpp"
#include "forge/cli.hpp"
#include "forge/emit.hpp"
#include "forge/executor.hpp"
#include "forge/invocation.hpp"
#include "forge/listing.hpp"
#include "forge/parser.hpp"
#include "forge/utility.hpp"

#include <iostream>
#include <optional>
#include <print>
#include <span>
#include <string_view>
#include <utility>

namespace {

int report(const forge::Error &err) {
    std::println(stderr, "error: {}", err.message);
    return forge::kEngineFailureExit;
}

} // namespace

int main(int argc, char **argv) {
    auto options = forge::parse_cli(std::span<const char *const>(argv, static_cast<size_t>(argc)));
    if (!options) {
        report(options.error());
        forge::print_usage(std::cerr);
        return forge::kEngineFailureExit;
    }

    if (options->command == forge::Command::Help) {
        forge::print_usage(std::cout);
        return 0;
    }

    forge::CatalogBuilder builder;
    if (auto res = forge::parse(builder, options->manifest); !res)
        return report(res.error());

    auto catalog = std::move(builder).build();
    if (!catalog)
        return report(catalog.error());

    switch (options->command) {
    case forge::Command::List:
        forge::list_recipes(std::cout, *catalog);
        return 0;
    case forge::Command::Summary:
        forge::list_summary(std::cout, *catalog);
        return 0;
    case forge::Command::Dump:
        forge::emit_dump(std::cout, *catalog);
        return 0;
    case forge::Command::Graph:
        forge::emit_graph(std::cout, *catalog);
        return 0;
    case forge::Command::Show: {
        auto recipe = catalog->resolve(*options->recipe);
        if (!recipe)
            return report(recipe.error());
        forge::show_recipe(std::cout, *catalog, **recipe);
        return 0;
    }
    case forge::Command::Help:
    case forge::Command::Run:
        break;
    }

    std::optional<std::string_view> name;
    if (options->recipe)
        name = *options->recipe;

    auto request = forge::make_request(*catalog, name, std::move(options->arguments));
    if (!request)
        return report(request.error());

    forge::Executor executor(forge::make_config(*options, catalog->settings));
    auto code = forge::invoke(*catalog, *request, executor);
    if (!code)
        return report(code.error());
    return *code;
}
