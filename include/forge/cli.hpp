#pragma once

#include "forge/executor.hpp"
#include "forge/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace forge {

enum class Command : uint8_t { Run, List, Summary, Show, Dump, Graph, Help };

struct CliOptions {
    Command command = Command::Run;
    std::filesystem::path manifest = "forge.json";
    std::optional<std::filesystem::path> working_directory = std::nullopt;
    std::optional<std::string> shell = std::nullopt;
    std::vector<std::string> shell_args;
    bool dry_run = false;
    bool quiet = false;
    ColorMode color = ColorMode::Auto;
    std::optional<std::string> recipe = std::nullopt; // Also the --show target
    std::vector<std::string> arguments;
};

// Options come first; the first positional word is the recipe, the rest are its arguments.
Result<CliOptions> parse_cli(std::span<const char *const> argv);

// Defaults, then manifest settings, then command-line flags.
ExecutorConfig make_config(const CliOptions &options, const Settings &settings);

void print_usage(std::ostream &out);

} // namespace forge
