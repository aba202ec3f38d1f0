#include "tests/test_suite.hpp"
#include "tests/testing_utils.hpp"

#include "forge/builder.hpp"
#include "forge/emit.hpp"
#include "forge/listing.hpp"
#include "forge/parser.hpp"

#include <cassert>
#include <print>
#include <sstream>
#include <string>

using namespace forge;

namespace {

constexpr std::string_view MANIFEST = R"({
    "settings": {"shell": ["bash", "-c"], "quiet": true},
    "aliases": {"b": "build", "_hidden": "build"},
    "recipes": [
        {"name": "_", "dependencies": ["help"]},
        {"name": "build", "doc": "compile local package", "dependencies": ["dev"]},
        {"name": "dev", "doc": "build `dev` profile", "body": ["@cargo build --all-targets"]},
        {"name": "fix", "doc": "apply lints", "subsequents": ["fmt"], "body": ["cargo clippy --fix"]},
        {"name": "fmt", "body": ["cargo fmt"]},
        {"name": "help", "doc": "list available recipes", "body": ["@forge --list"]},
        {
            "name": "run",
            "doc": "run binary",
            "parameters": ["package", {"name": "opts", "variadic": true}],
            "dependencies": [{"name": "stage", "arguments": ["release"]}],
            "body": ["@cargo run --release -p {{ package }} -- {{ opts }}"]
        },
        {"name": "stage", "private": true, "parameters": [{"name": "profile", "default": "dev"}],
         "body": ["echo {{ profile }}"]}
    ]
})";

Catalog load(std::string_view text) {
    CatalogBuilder builder;
    auto res = parse_manifest(builder, text);
    if (!res) {
        std::println(stderr, "{}", res.error().message);
    }
    assert(res);
    auto catalog = std::move(builder).build();
    assert(catalog);
    return std::move(*catalog);
}

Error load_error(std::string_view text) {
    CatalogBuilder builder;
    auto res = parse_manifest(builder, text);
    if (!res)
        return res.error();
    auto catalog = std::move(builder).build();
    assert(!catalog);
    return catalog.error();
}

void manifest_populates_the_catalog() {
    Catalog catalog = load(MANIFEST);

    assert((catalog.settings.shell == std::vector<std::string>{"bash", "-c"}));
    assert(catalog.settings.quiet);
    assert(catalog.registry.recipes().size() == 8);
    assert(catalog.registry.recipes()[0].is_private);
    assert(catalog.aliases.resolve("b") == "build");

    auto run = catalog.registry.lookup("run");
    assert(run);
    const Recipe &r = **run;
    assert(r.parameters.size() == 2);
    assert(r.parameters[1].variadic);
    assert(r.dependencies.size() == 1);
    assert((r.dependencies[0].arguments == std::vector<std::string>{"release"}));
    assert(r.lines.size() == 1 && r.lines[0].quiet);

    auto stage = catalog.registry.lookup("stage");
    assert(stage && (*stage)->is_private);
    assert((*stage)->parameters[0].default_value == "dev");
}

void manifest_errors_name_the_field() {
    Error not_json = load_error("{ recipes: ");
    assert(not_json.code == ErrorCode::MalformedManifest);

    Error bad_body = load_error(R"({"recipes": [{"name": "x", "body": "echo"}]})");
    assert(bad_body.code == ErrorCode::MalformedManifest);
    assert(bad_body.message.find("recipes[0].body") != std::string::npos);

    Error bad_flag = load_error(R"({"recipes": [{"name": "x", "private": "yes"}]})");
    assert(bad_flag.code == ErrorCode::MalformedManifest);
    assert(bad_flag.message.find("private") != std::string::npos);

    Error no_name = load_error(R"({"recipes": [{"body": []}]})");
    assert(no_name.code == ErrorCode::MalformedManifest);
    assert(no_name.message.find("recipes[0].name") != std::string::npos);

    Error bad_arg = load_error(R"({"recipes": [{"name": "a", "dependencies": [{"name": "b", "arguments": [1]}]}]})");
    assert(bad_arg.code == ErrorCode::MalformedManifest);
    assert(bad_arg.message.find("recipes[0].dependencies[0].arguments[0]") != std::string::npos);

    Error cycle = load_error(R"({"recipes": [{"name": "a", "dependencies": ["b"]}, {"name": "b", "dependencies": ["a"]}]})");
    assert(cycle.code == ErrorCode::DependencyCycle);

    Error dangling = load_error(R"({"aliases": {"x": "nope"}, "recipes": [{"name": "a"}]})");
    assert(dangling.code == ErrorCode::UnknownAlias);
}

void manifest_file_is_read_from_disk() {
    ScratchDir dir("manifest");
    create_file(dir / "forge.json", std::string(MANIFEST));

    CatalogBuilder builder;
    assert(parse(builder, dir / "forge.json"));
    assert(builder.recipes().size() == 8);

    CatalogBuilder missing;
    auto res = parse(missing, dir / "absent.json");
    assert(!res);
    assert(res.error().code == ErrorCode::MalformedManifest);
}

void dump_reloads_to_the_same_catalog() {
    Catalog catalog = load(MANIFEST);
    auto dumped = to_json(catalog);
    Catalog reloaded = load(dumped.dump());
    assert(to_json(reloaded) == dumped);
    assert(dumped["recipes"][0]["name"] == "_");
    assert(dumped["aliases"]["b"] == "build");
}

void graph_lists_both_edge_kinds() {
    Catalog catalog = load(MANIFEST);
    std::ostringstream out;
    emit_graph(out, catalog);
    std::string dot = out.str();
    assert(dot.starts_with("digraph forge {"));
    assert(dot.find("\"build\" -> \"dev\";") != std::string::npos);
    assert(dot.find("\"fix\" -> \"fmt\" [style=dashed];") != std::string::npos);
}

} // namespace

bool manifest_test() {
    std::println("Starting Manifest Test...");
    manifest_populates_the_catalog();
    manifest_errors_name_the_field();
    manifest_file_is_read_from_disk();
    dump_reloads_to_the_same_catalog();
    graph_lists_both_edge_kinds();
    std::println("Manifest Test passed!");
    return true;
}

bool listing_test() {
    std::println("Starting Listing Test...");
    Catalog catalog = load(MANIFEST);

    std::ostringstream list;
    list_recipes(list, catalog);
    assert(list.str() == "Available recipes:\n"
                         "    build             # compile local package [alias: b]\n"
                         "    dev               # build `dev` profile\n"
                         "    fix               # apply lints\n"
                         "    fmt\n"
                         "    help              # list available recipes\n"
                         "    run package *opts # run binary\n");

    std::ostringstream summary;
    list_summary(summary, catalog);
    assert(summary.str() == "build dev fix fmt help run\n");

    std::ostringstream show;
    auto run = catalog.resolve("run");
    assert(run);
    show_recipe(show, catalog, **run);
    assert(show.str() == "# run binary\n"
                         "run package *opts: (stage \"release\")\n"
                         "    @cargo run --release -p {{ package }} -- {{ opts }}\n");

    std::ostringstream fix;
    show_recipe(fix, catalog, **catalog.resolve("fix"));
    assert(fix.str() == "# apply lints\nfix: && fmt\n    cargo clippy --fix\n");

    Recipe tag = make_recipe("tag", {}, {"git tag {{ label }}"});
    tag.parameters.push_back({"label"});
    Recipe release = make_recipe("release");
    release.dependencies.push_back({"tag", {R"(say "hi" \o/)"}});
    Catalog quoting = make_catalog({tag, release});
    std::ostringstream escaped;
    show_recipe(escaped, quoting, **quoting.resolve("release"));
    assert(escaped.str() == R"(release: (tag "say \"hi\" \\o/"))" "\n");

    std::println("Listing Test passed!");
    return true;
}
