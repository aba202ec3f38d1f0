#include "forge/cli.hpp"

#include <print>
#include <string_view>

namespace forge {

namespace {

struct OptionValue {
    std::string_view flag;
    std::optional<std::string_view> inline_value; // From `--flag=value`
};

OptionValue split_option(std::string_view arg) {
    if (arg.starts_with("--")) {
        if (auto eq = arg.find('='); eq != std::string_view::npos) {
            return {arg.substr(0, eq), arg.substr(eq + 1)};
        }
    }
    return {arg, std::nullopt};
}

Result<ColorMode> parse_color(std::string_view value) {
    if (value == "auto")
        return ColorMode::Auto;
    if (value == "always")
        return ColorMode::Always;
    if (value == "never")
        return ColorMode::Never;
    return fail(ErrorCode::Usage, "Invalid --color value `{}` (expected auto, always or never)", value);
}

} // namespace

Result<CliOptions> parse_cli(std::span<const char *const> argv) {
    CliOptions options;
    bool options_done = false;

    for (size_t i = 1; i < argv.size(); ++i) {
        std::string_view arg = argv[i];

        if (options.recipe && options.command == Command::Run) {
            options.arguments.emplace_back(arg);
            continue;
        }
        if (options_done || !arg.starts_with('-') || arg == "-") {
            if (options.command != Command::Run) {
                return fail(ErrorCode::Usage, "Unexpected argument `{}`", arg);
            }
            options.recipe = std::string(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        auto [flag, inline_value] = split_option(arg);
        auto take_value = [&]() -> Result<std::string_view> {
            if (inline_value)
                return *inline_value;
            if (i + 1 >= argv.size()) {
                return fail(ErrorCode::Usage, "Option `{}` requires a value", flag);
            }
            return std::string_view(argv[++i]);
        };
        auto set_command = [&](Command command) -> Result<void> {
            if (options.command != Command::Run) {
                return fail(ErrorCode::Usage, "Option `{}` conflicts with an earlier option", flag);
            }
            options.command = command;
            return {};
        };

        Result<void> res;
        if (flag == "-f" || flag == "--manifest") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            options.manifest = *value;
        } else if (flag == "-d" || flag == "--working-directory") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            options.working_directory = *value;
        } else if (flag == "--shell") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            options.shell = std::string(*value);
        } else if (flag == "--shell-arg") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            options.shell_args.emplace_back(*value);
        } else if (flag == "--color") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            auto color = parse_color(*value);
            if (!color)
                return std::unexpected(color.error());
            options.color = *color;
        } else if (flag == "-n" || flag == "--dry-run") {
            options.dry_run = true;
        } else if (flag == "-q" || flag == "--quiet") {
            options.quiet = true;
        } else if (flag == "-l" || flag == "--list") {
            res = set_command(Command::List);
        } else if (flag == "--summary") {
            res = set_command(Command::Summary);
        } else if (flag == "--dump") {
            res = set_command(Command::Dump);
        } else if (flag == "--graph") {
            res = set_command(Command::Graph);
        } else if (flag == "-h" || flag == "--help") {
            res = set_command(Command::Help);
        } else if (flag == "--show") {
            auto value = take_value();
            if (!value)
                return std::unexpected(value.error());
            res = set_command(Command::Show);
            options.recipe = std::string(*value);
        } else {
            return fail(ErrorCode::Usage, "Unknown option `{}`", arg);
        }

        if (!res)
            return std::unexpected(res.error());
    }

    return options;
}

ExecutorConfig make_config(const CliOptions &options, const Settings &settings) {
    ExecutorConfig config;
    config.shell = settings.shell;
    if (options.shell) {
        config.shell = {*options.shell};
        if (options.shell_args.empty())
            config.shell.emplace_back("-cu");
    } else if (!options.shell_args.empty()) {
        config.shell.resize(1);
    }
    config.shell.insert(config.shell.end(), options.shell_args.begin(), options.shell_args.end());

    if (options.working_directory) {
        config.working_directory = *options.working_directory;
    } else {
        std::error_code ec;
        auto manifest = std::filesystem::absolute(options.manifest, ec);
        if (!ec)
            config.working_directory = manifest.parent_path();
    }

    config.dry_run = options.dry_run;
    config.quiet = options.quiet || settings.quiet;
    config.color = options.color;
    return config;
}

void print_usage(std::ostream &out) {
    std::println(out, "usage: forge [options] [recipe [arguments...]]");
    std::println(out, "");
    std::println(out, "options:");
    std::println(out, "  -f, --manifest PATH           recipe manifest (default: forge.json)");
    std::println(out, "  -d, --working-directory DIR   run commands in DIR (default: manifest directory)");
    std::println(out, "  -n, --dry-run                 print commands without running them");
    std::println(out, "  -q, --quiet                   do not echo commands");
    std::println(out, "      --shell CMD               shell used to run command lines (default: sh)");
    std::println(out, "      --shell-arg ARG           argument passed to the shell (default: -cu)");
    std::println(out, "      --color auto|always|never");
    std::println(out, "  -l, --list                    list recipes");
    std::println(out, "      --summary                 list recipe names on one line");
    std::println(out, "      --show NAME               print a recipe");
    std::println(out, "      --dump                    print the catalog as JSON");
    std::println(out, "      --graph                   print the dependency graph as Graphviz dot");
    std::println(out, "  -h, --help                    show this message");
}

} // namespace forge
