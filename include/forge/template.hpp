#pragma once

#include "forge/domain.hpp"
#include "forge/utility.hpp"

#include <string_view>
#include <vector>

namespace forge {

// Letters, digits, `_` and `-`, not starting with a digit or `-`.
bool is_identifier(std::string_view sv);

// Splits `text` into literal text and `{{ name }}` placeholders. `{{{{` is a literal `{{`.
Result<std::vector<Fragment>> parse_template(std::string_view text);

// Strips the leading `@` (quiet) and `-` (ignore errors) prefixes, then parses the rest.
Result<Line> compile_line(std::string_view raw);

} // namespace forge
