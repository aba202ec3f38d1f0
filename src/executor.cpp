#include "forge/executor.hpp"

#include "forge/process_exec.hpp"
#include "forge/utility.hpp"

#if FF_forge__profiling
#include <chrono>
#endif
#include <cstdio>
#include <print>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace forge {

Executor::Executor(ExecutorConfig config) : Executor(std::move(config), process_exec) {
}

Executor::Executor(ExecutorConfig config, Spawn spawn) : config(std::move(config)), spawn(std::move(spawn)) {
    switch (this->config.color) {
    case ColorMode::Always:
        color = true;
        break;
    case ColorMode::Never:
        color = false;
        break;
    case ColorMode::Auto:
        color = isatty(STDERR_FILENO) == 1;
        break;
    }
}

bool Executor::echo_enabled(const Recipe &recipe, const RenderedLine &line) const {
    if (config.dry_run)
        return true;
    if (config.quiet)
        return false;
    // `@` flips the recipe's own setting.
    return recipe.quiet == line.quiet;
}

void Executor::echo(const RenderedLine &line) const {
    if (color)
        std::println(stderr, "\033[1m{}\033[0m", line.command);
    else
        std::println(stderr, "{}", line.command);
}

Result<int> Executor::run(const std::vector<BoundCommand> &commands) {
    for (size_t step = 0; step < commands.size(); ++step) {
        const BoundCommand &command = commands[step];
        const Recipe &recipe = *command.recipe;

#if FF_forge__logging
        std::println(stderr, "[{}/{}] {}", step + 1, commands.size(), recipe.name);
#endif
#if FF_forge__profiling
        auto start = std::chrono::steady_clock::now();
#endif

        for (size_t i = 0; i < command.lines.size(); ++i) {
            const RenderedLine &line = command.lines[i];
            if (echo_enabled(recipe, line))
                echo(line);
            if (config.dry_run)
                continue;

            std::vector<std::string> args = config.shell;
            args.push_back(line.command);

            auto res = spawn(args, config.working_directory);
            if (!res) {
                return fail(res.error().code, "Recipe `{}` (step {}) line {}: {}", recipe.name, step + 1, i + 1,
                            res.error().message);
            }

            const ProcessStatus &status = *res;
            if (status.signal) {
                std::println(stderr, "error: Recipe `{}` was terminated on line {} by signal {}", recipe.name,
                             i + 1, *status.signal);
                return status.exit_code();
            }
            if (status.code != 0 && !line.ignore_errors) {
                std::println(stderr, "error: Recipe `{}` failed on line {} with exit code {}", recipe.name, i + 1,
                             status.code);
                return status.code;
            }
            if (status.interrupt) {
                // The child survived the forwarded signal; the rest of the plan is abandoned anyway.
                std::println(stderr, "error: Recipe `{}` interrupted on line {} by signal {}", recipe.name, i + 1,
                             *status.interrupt);
                return status.code != 0 ? status.code : 128 + *status.interrupt;
            }
        }

#if FF_forge__profiling
        std::chrono::duration<double> diff = std::chrono::steady_clock::now() - start;
        std::println(stderr, "Step {} took {:.4f}s", recipe.name, diff.count());
#endif
    }
    return 0;
}

} // namespace forge
