#pragma once

#include "forge/binder.hpp"
#include "forge/domain.hpp"
#include "forge/process_exec.hpp"
#include "forge/utility.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace forge {

enum class ColorMode : uint8_t { Auto, Always, Never };

struct ExecutorConfig {
    std::vector<std::string> shell = {"sh", "-cu"};
    std::filesystem::path working_directory = {};
    bool dry_run = false;
    bool quiet = false;
    ColorMode color = ColorMode::Auto;
};

class Executor {
public:
    using Spawn = std::function<Result<ProcessStatus>(const std::vector<std::string> &, const std::filesystem::path &)>;

    explicit Executor(ExecutorConfig config);
    // Tests substitute the process boundary.
    Executor(ExecutorConfig config, Spawn spawn);

    // Returns 0, or the exit code of the step that stopped the plan.
    Result<int> run(const std::vector<BoundCommand> &commands);

private:
    bool echo_enabled(const Recipe &recipe, const RenderedLine &line) const;
    void echo(const RenderedLine &line) const;

    ExecutorConfig config;
    Spawn spawn;
    bool color = false;
};

} // namespace forge
