#pragma once

#include "docpatch/core/doc_result.hpp"
#include <optional>
#include <regex>
#include <string_view>

namespace docpatch::anchor_locator {

// Search bounds around a line hint. Upstream hints drift by a few lines, so
// the locator looks mostly forward and only a little backward.
inline constexpr size_t kForwardWindow = 20;
inline constexpr size_t kBackwardWindow = 5;

// Line matchers, compiled once
auto function_pattern() -> const std::regex&;
auto struct_pattern() -> const std::regex&;
auto field_pattern() -> const std::regex&;
auto attribute_pattern() -> const std::regex&;

auto pattern_for(ItemKind kind) -> const std::regex&;

auto matches(std::string_view line, const std::regex& pattern) -> bool;

// First matching line in [start, start + 20), else the nearest one in
// [start - 5, start) scanning upward.
auto find_line_near(std::string_view source, size_t start_line0, const std::regex& pattern)
    -> std::optional<size_t>;

// Fields are positioned exactly by the caller and are returned unchanged,
// unless the line lies past the end of the source
auto find_anchor(std::string_view source, size_t approx_line0, ItemKind kind)
    -> std::optional<size_t>;

} // namespace docpatch::anchor_locator
