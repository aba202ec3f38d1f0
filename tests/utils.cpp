#include "tests/testing_utils.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <print>
#include <sstream>
#include <unistd.h>

void create_file(const std::filesystem::path &path, const std::string &content) {
    std::ofstream f(path);
    f << content;
    f.close();
}

std::string read_file(const std::filesystem::path &path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

ScratchDir::ScratchDir(std::string_view tag) {
    static int counter = 0;
    path_ = std::filesystem::temp_directory_path() / std::format("forge-{}-{}-{}", tag, getpid(), counter++);
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

forge::Recipe make_recipe(std::string name, std::vector<std::string> dependencies, std::vector<std::string> body) {
    forge::Recipe recipe;
    recipe.name = std::move(name);
    for (auto &dep : dependencies) {
        recipe.dependencies.push_back({std::move(dep), {}});
    }
    recipe.body = std::move(body);
    return recipe;
}

forge::Result<forge::Catalog> try_catalog(std::vector<forge::Recipe> recipes, std::vector<forge::Alias> aliases) {
    forge::CatalogBuilder builder;
    for (auto &recipe : recipes) {
        if (auto res = builder.add_recipe(std::move(recipe)); !res)
            return std::unexpected(res.error());
    }
    for (const auto &alias : aliases) {
        builder.add_alias(alias.name, alias.target);
    }
    return std::move(builder).build();
}

forge::Catalog make_catalog(std::vector<forge::Recipe> recipes, std::vector<forge::Alias> aliases) {
    auto catalog = try_catalog(std::move(recipes), std::move(aliases));
    if (!catalog) {
        std::println(std::cerr, "Failed to build catalog: {}", catalog.error().message);
        std::abort();
    }
    return std::move(*catalog);
}

std::vector<std::string> plan_names(const forge::ExecutionPlan &plan) {
    std::vector<std::string> names;
    for (const auto &entry : plan.entries) {
        names.push_back(entry.recipe->name);
    }
    return names;
}
