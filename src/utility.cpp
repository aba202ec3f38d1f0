#include "forge/utility.hpp"

namespace forge {

ErrorCategory category(ErrorCode code) {
    switch (code) {
    case ErrorCode::DuplicateRecipe:
    case ErrorCode::AliasCollision:
    case ErrorCode::UnresolvedDependency:
    case ErrorCode::DependencyCycle:
    case ErrorCode::UnresolvedPlaceholder:
    case ErrorCode::MalformedTemplate:
    case ErrorCode::InvalidParameters:
    case ErrorCode::DependencyArity:
    case ErrorCode::DuplicateDefault:
    case ErrorCode::MalformedManifest:
        return ErrorCategory::Definition;
    case ErrorCode::UnknownRecipe:
    case ErrorCode::UnknownAlias:
    case ErrorCode::NoDefaultRecipe:
        return ErrorCategory::Resolution;
    case ErrorCode::MissingArgument:
    case ErrorCode::TooManyArguments:
        return ErrorCategory::Bind;
    case ErrorCode::SpawnFailed:
        return ErrorCategory::Execution;
    case ErrorCode::Usage:
        return ErrorCategory::Usage;
    }
    return ErrorCategory::Usage;
}

} // namespace forge
