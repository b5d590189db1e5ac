#pragma once

#include "docpatch/core/doc_result.hpp"
#include "docpatch/core/insertion_resolver.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

// Byte range [start, end) of the original text and its replacement
struct Edit {
    size_t start{};
    size_t end{};
    std::string text;

    auto operator==(const Edit& other) const -> bool = default;
};

// Apply edits from the highest start offset down so earlier offsets stay
// valid. Edits with start > end or end past the text are skipped.
auto apply_edits(std::string text, std::vector<Edit> edits) -> std::string;

// Re-indent a doc block to match target_line. Always ends with one '\n'.
auto indent_like(std::string_view target_line, std::string_view doc) -> std::string;

auto needs_leading_blank_line(std::string_view source, size_t line0) -> bool;

auto add_leading_blank_if_needed(std::string_view source, size_t line0, std::string block)
    -> std::string;

// Full replacement text for a resolved slot: indented doc block, plus a
// separating blank line for items that are not fields.
auto build_replacement(std::string_view source, const InsertionSlot& slot, size_t anchor_line0,
                       ItemKind kind, std::string_view doc) -> std::string;

} // namespace docpatch
