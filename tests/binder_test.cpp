#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "forge/binder.hpp"
#include "forge/builder.hpp"
#include "forge/template.hpp"

#include <cassert>
#include <print>
#include <string>
#include <variant>
#include <vector>

using namespace forge;

namespace {

using Args = std::vector<std::string>;

const Recipe &only(const Catalog &catalog, std::string_view name) {
    auto recipe = catalog.registry.lookup(name);
    assert(recipe);
    return **recipe;
}

void missing_required_argument() {
    Recipe deploy = make_recipe("deploy", {}, {"./deploy.sh {{ target }}"});
    deploy.parameters.push_back({"target"});
    Catalog catalog = make_catalog({deploy});

    auto none = bind_arguments(only(catalog, "deploy"), Args{});
    assert(!none);
    assert(none.error().code == ErrorCode::MissingArgument);
    assert(none.error().category() == ErrorCategory::Bind);
    assert(none.error().message.find("`deploy`") != std::string::npos);
    assert(none.error().message.find("`target`") != std::string::npos);

    auto one = bind_arguments(only(catalog, "deploy"), Args{"staging area"});
    assert(one);
    assert(one->lines.size() == 1);
    assert(one->lines[0].command == "./deploy.sh staging area");
    assert(std::holds_alternative<binding::Fixed>(*one->find("target")));
}

void variadic_captures_the_tail() {
    Recipe run = make_recipe("run", {}, {"@cargo run --release -p {{ package }} -- {{ opts }}"});
    run.parameters.push_back({"package"});
    run.parameters.push_back({"opts", std::nullopt, true});
    Catalog catalog = make_catalog({run});

    auto bound = bind_arguments(only(catalog, "run"), Args{"mypackage", "--release"});
    assert(bound);
    const auto *opts = std::get_if<binding::Variadic>(bound->find("opts"));
    assert(opts);
    assert((opts->values == Args{"--release"}));
    assert(bound->lines[0].command == "cargo run --release -p mypackage -- --release");
    assert(bound->lines[0].command.ends_with("--release"));
    assert(bound->lines[0].quiet);

    auto several = bind_arguments(only(catalog, "run"), Args{"app", "a", "b c", "d"});
    assert(several);
    assert(several->lines[0].command == "cargo run --release -p app -- a b c d");

    auto empty = bind_arguments(only(catalog, "run"), Args{"app"});
    assert(empty);
    assert(std::get<binding::Variadic>(*empty->find("opts")).values.empty());
    assert(empty->lines[0].command == "cargo run --release -p app -- ");
}

void variadic_default_applies_when_empty() {
    Recipe test = make_recipe("test", {}, {"cargo test {{ opts }}"});
    test.parameters.push_back({"opts", "--quiet", true});
    Catalog catalog = make_catalog({test});

    auto defaulted = bind_arguments(only(catalog, "test"), Args{});
    assert(defaulted);
    assert(std::holds_alternative<binding::Default>(*defaulted->find("opts")));
    assert(defaulted->lines[0].command == "cargo test --quiet");

    auto supplied = bind_arguments(only(catalog, "test"), Args{"-v"});
    assert(supplied);
    assert(supplied->lines[0].command == "cargo test -v");
}

void defaults_fill_trailing_parameters() {
    Recipe pack = make_recipe("pack", {}, {"tar -c{{ mode }}f {{ out }} {{ dir }}"});
    pack.parameters.push_back({"dir"});
    pack.parameters.push_back({"out", "out.tar"});
    pack.parameters.push_back({"mode", ""});
    Catalog catalog = make_catalog({pack});

    auto one = bind_arguments(only(catalog, "pack"), Args{"src"});
    assert(one);
    assert(one->lines[0].command == "tar -cf out.tar src");
    assert(std::holds_alternative<binding::Default>(*one->find("out")));

    auto all = bind_arguments(only(catalog, "pack"), Args{"src", "x.tgz", "z"});
    assert(all);
    assert(all->lines[0].command == "tar -czf x.tgz src");
}

void too_many_arguments() {
    Recipe clean = make_recipe("clean", {}, {"rm -rf build"});
    Catalog catalog = make_catalog({clean});
    auto res = bind_arguments(only(catalog, "clean"), Args{"extra"});
    assert(!res);
    assert(res.error().code == ErrorCode::TooManyArguments);
    assert(res.error().message.find("`clean`") != std::string::npos);
}

void undeclared_placeholder_is_a_definition_error() {
    CatalogBuilder builder;
    auto res = builder.add_recipe(make_recipe("build", {}, {"make {{ target }}"}));
    assert(!res);
    assert(res.error().code == ErrorCode::UnresolvedPlaceholder);
    assert(res.error().category() == ErrorCategory::Definition);
    assert(res.error().message.find("`target`") != std::string::npos);
}

void parameter_shapes_are_checked() {
    CatalogBuilder builder;

    Recipe early_variadic = make_recipe("a");
    early_variadic.parameters = {{"rest", std::nullopt, true}, {"last"}};
    auto res = builder.add_recipe(std::move(early_variadic));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);

    Recipe twice = make_recipe("b");
    twice.parameters = {{"x"}, {"x"}};
    res = builder.add_recipe(std::move(twice));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);

    Recipe gap = make_recipe("c");
    gap.parameters = {{"x", "1"}, {"y"}};
    res = builder.add_recipe(std::move(gap));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);

    res = builder.add_recipe(make_recipe("say \"hi\""));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);
    res = builder.add_recipe(make_recipe("9lives"));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);

    Recipe spaced = make_recipe("d");
    spaced.parameters = {{"two words"}};
    res = builder.add_recipe(std::move(spaced));
    assert(!res && res.error().code == ErrorCode::InvalidParameters);

    assert(is_identifier("_") && is_identifier("build-all") && !is_identifier("-x") && !is_identifier(""));
}

void plan_binding_stops_at_first_failure() {
    Recipe deploy = make_recipe("deploy", {"build"}, {"deploy {{ env }}"});
    deploy.parameters.push_back({"env"});
    Catalog catalog = make_catalog({deploy, make_recipe("build", {}, {"make"})});

    auto root = catalog.registry.lookup("deploy");
    assert(root);
    auto missing = bind_plan(plan(catalog.registry, **root, {}));
    assert(!missing);
    assert(missing.error().code == ErrorCode::MissingArgument);

    auto ok = bind_plan(plan(catalog.registry, **root, {"prod"}));
    assert(ok);
    assert(ok->size() == 2);
    assert((*ok)[0].lines[0].command == "make");
    assert((*ok)[1].lines[0].command == "deploy prod");
}

} // namespace

bool binder_test() {
    std::println("Starting Binder Test...");
    missing_required_argument();
    variadic_captures_the_tail();
    variadic_default_applies_when_empty();
    defaults_fill_trailing_parameters();
    too_many_arguments();
    undeclared_placeholder_is_a_definition_error();
    parameter_shapes_are_checked();
    plan_binding_stops_at_first_failure();
    std::println("Binder Test passed!");
    return true;
}

bool template_test() {
    std::println("Starting Template Test...");

    auto fragments = parse_template("echo {{name}} and {{  other  }}!");
    assert(fragments);
    assert(fragments->size() == 5);
    assert(std::get<fragment::Text>((*fragments)[0]).text == "echo ");
    assert(std::get<fragment::Placeholder>((*fragments)[1]).parameter == "name");
    assert(std::get<fragment::Placeholder>((*fragments)[3]).parameter == "other");
    assert(std::get<fragment::Text>((*fragments)[4]).text == "!");

    auto escaped = parse_template("echo '{{{{literal}}'");
    assert(escaped);
    assert(escaped->size() == 1);
    assert(std::get<fragment::Text>((*escaped)[0]).text == "echo '{{literal}}'");

    auto unterminated = parse_template("echo {{ name");
    assert(!unterminated);
    assert(unterminated.error().code == ErrorCode::MalformedTemplate);

    auto not_a_name = parse_template("echo {{ a + b }}");
    assert(!not_a_name);
    assert(not_a_name.error().code == ErrorCode::MalformedTemplate);

    auto quiet = compile_line("@echo hi");
    assert(quiet && quiet->quiet && !quiet->ignore_errors && quiet->source == "echo hi");

    auto both = compile_line("-@rm missing");
    assert(both && both->quiet && both->ignore_errors && both->source == "rm missing");

    auto other_order = compile_line("@-rm missing");
    assert(other_order && other_order->quiet && other_order->ignore_errors);

    auto plain = compile_line("make all");
    assert(plain && !plain->quiet && !plain->ignore_errors);

    std::println("Template Test passed!");
    return true;
}
