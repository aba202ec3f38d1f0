#pragma once

#include "forge/builder.hpp"
#include "forge/executor.hpp"
#include "forge/resolver.hpp"
#include "forge/utility.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace forge {

enum class Stage : uint8_t { Resolving, Planning, Binding, Executing, Succeeded, Failed };

std::string_view to_string(Stage stage);

struct InvocationRequest {
    std::string recipe_name; // Canonical, after alias resolution
    std::vector<std::string> arguments;
};

// No name selects the default recipe, which then takes no arguments.
Result<InvocationRequest> make_request(const Catalog &catalog, std::optional<std::string_view> name,
                                       std::vector<std::string> arguments);

Result<ExecutionPlan> plan(const Catalog &catalog, const InvocationRequest &request);

// Resolving -> Planning -> Binding -> Executing. Nothing is spawned unless binding succeeds
// for every plan entry.
Result<int> invoke(const Catalog &catalog, const InvocationRequest &request, Executor &executor);

} // namespace forge
