#pragma once
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace forge {

enum class ErrorCategory : uint8_t { Definition, Resolution, Bind, Execution, Usage };

enum class ErrorCode : uint8_t {
    // Definition
    DuplicateRecipe,
    AliasCollision,
    UnresolvedDependency,
    DependencyCycle,
    UnresolvedPlaceholder,
    MalformedTemplate,
    InvalidParameters,
    DependencyArity,
    DuplicateDefault,
    MalformedManifest,
    // Resolution
    UnknownRecipe,
    UnknownAlias,
    NoDefaultRecipe,
    // Bind
    MissingArgument,
    TooManyArguments,
    // Execution
    SpawnFailed,
    // Usage
    Usage,
};

ErrorCategory category(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    ErrorCategory category() const {
        return forge::category(code);
    }
};

template <typename T> using Result = std::expected<T, Error>;

template <typename... Args>
std::unexpected<Error> fail(ErrorCode code, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{code, std::format(fmt, std::forward<Args>(args)...)});
}

// Exit status for anything that goes wrong before or around a child process.
inline constexpr int kEngineFailureExit = 125;

// Lets std::string keyed maps be searched with a std::string_view.
struct StringHash {
    using is_transparent = void;
    size_t operator()(std::string_view sv) const {
        return std::hash<std::string_view>{}(sv);
    }
};

} // namespace forge
