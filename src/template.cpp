#include "forge/template.hpp"

#include "forge/utility.hpp"

#include <cctype>
#include <string>
#include <string_view>

namespace forge {

namespace {

std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

} // namespace

bool is_identifier(std::string_view sv) {
    if (sv.empty())
        return false;
    auto head = static_cast<unsigned char>(sv.front());
    if (!std::isalpha(head) && head != '_')
        return false;
    for (char c : sv) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && uc != '_' && uc != '-')
            return false;
    }
    return true;
}

Result<std::vector<Fragment>> parse_template(std::string_view text) {
    std::vector<Fragment> fragments;
    std::string literal;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            literal.append(text.substr(pos));
            break;
        }
        literal.append(text.substr(pos, open - pos));

        if (text.substr(open).starts_with("{{{{")) { // Escaped braces
            literal.append("{{");
            pos = open + 4;
            continue;
        }

        size_t close = text.find("}}", open + 2);
        if (close == std::string_view::npos) {
            return fail(ErrorCode::MalformedTemplate, "Unterminated placeholder in: {}", text);
        }

        std::string_view name = trim(text.substr(open + 2, close - (open + 2)));
        if (!is_identifier(name)) {
            return fail(ErrorCode::MalformedTemplate, "Invalid placeholder `{}` in: {}",
                        text.substr(open, close + 2 - open), text);
        }

        if (!literal.empty()) {
            fragments.emplace_back(fragment::Text{std::move(literal)});
            literal.clear();
        }
        fragments.emplace_back(fragment::Placeholder{std::string(name)});
        pos = close + 2;
    }

    if (!literal.empty())
        fragments.emplace_back(fragment::Text{std::move(literal)});
    return fragments;
}

Result<Line> compile_line(std::string_view raw) {
    Line line;
    // Either order: `@-` or `-@`
    for (int i = 0; i < 2 && !raw.empty(); ++i) {
        if (raw.front() == '@' && !line.quiet) {
            line.quiet = true;
            raw.remove_prefix(1);
        } else if (raw.front() == '-' && !line.ignore_errors) {
            line.ignore_errors = true;
            raw.remove_prefix(1);
        }
    }

    auto fragments = parse_template(raw);
    if (!fragments)
        return std::unexpected(fragments.error());

    line.source = std::string(raw);
    line.fragments = std::move(*fragments);
    return line;
}

} // namespace forge
