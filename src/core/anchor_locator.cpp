#include "docpatch/core/anchor_locator.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>

namespace docpatch::anchor_locator {

auto function_pattern() -> const std::regex& {
    static const std::regex pattern{
        R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:async\s+)?(?:const\s+)?(?:unsafe\s+)?(?:extern\s+"[^"]*"\s+)?fn\b)"};
    return pattern;
}

auto struct_pattern() -> const std::regex& {
    static const std::regex pattern{R"(^\s*(?:pub(?:\([^)]*\))?\s+)?struct\b)"};
    return pattern;
}

auto field_pattern() -> const std::regex& {
    static const std::regex pattern{
        R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:r#)?[A-Za-z_][A-Za-z0-9_]*\s*:\s*[^;{}]+,?\s*$)"};
    return pattern;
}

auto attribute_pattern() -> const std::regex& {
    static const std::regex pattern{R"(^\s*#\[)"};
    return pattern;
}

auto pattern_for(ItemKind kind) -> const std::regex& {
    switch (kind) {
    case ItemKind::STRUCT_TYPE:
        return struct_pattern();
    case ItemKind::FIELD:
        return field_pattern();
    case ItemKind::FUNCTION:
        return function_pattern();
    }
    return function_pattern();
}

auto matches(std::string_view line, const std::regex& pattern) -> bool {
    return std::regex_search(line.begin(), line.end(), pattern);
}

auto find_line_near(std::string_view source, size_t start_line0, const std::regex& pattern)
    -> std::optional<size_t> {
    auto lines = split_lines(source);
    size_t total = lines.size();

    size_t forward_end = std::min(start_line0 + kForwardWindow, total);
    for (size_t i = std::min(start_line0, total); i < forward_end; ++i) {
        if (matches(lines[i], pattern)) {
            return i;
        }
    }

    size_t backward_lo = start_line0 >= kBackwardWindow ? start_line0 - kBackwardWindow : 0;
    for (size_t i = std::min(start_line0, total); i > backward_lo; --i) {
        if (matches(lines[i - 1], pattern)) {
            return i - 1;
        }
    }

    return std::nullopt;
}

auto find_anchor(std::string_view source, size_t approx_line0, ItemKind kind)
    -> std::optional<size_t> {
    if (kind == ItemKind::FIELD) {
        // A doc line must be followed by the field it documents
        if (approx_line0 >= split_lines(source).size()) {
            return std::nullopt;
        }
        return approx_line0;
    }
    return find_line_near(source, approx_line0, pattern_for(kind));
}

} // namespace docpatch::anchor_locator
