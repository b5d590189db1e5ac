#pragma once

#include "docpatch/core/doc_result.hpp"
#include <optional>
#include <string_view>
#include <utility>

namespace docpatch {

// Where a doc block goes. BEFORE is the zero-width range [lo, lo);
// REPLACE overwrites lines [lo, hi) of the original text.
struct InsertionSlot {
    enum class Type { BEFORE, REPLACE };

    Type type = Type::BEFORE;
    size_t lo{};
    size_t hi{};

    static auto before(size_t line0) -> InsertionSlot { return {Type::BEFORE, line0, line0}; }
    static auto replace(size_t lo, size_t hi) -> InsertionSlot { return {Type::REPLACE, lo, hi}; }

    auto operator==(const InsertionSlot& other) const -> bool = default;
};

namespace insertion_resolver {

// Range above a function-like anchor: [first doc/attr-covered line, anchor or
// top attribute). Absorbs one blank line directly above an unattributed anchor.
auto function_doc_range(std::string_view source, size_t sig_line0) -> std::pair<size_t, size_t>;

// Struct documentation goes above the topmost attribute. nullopt when a doc
// block already sits there and overwrite is off.
auto struct_doc_slot(std::string_view source, size_t struct_line0, bool overwrite)
    -> std::optional<InsertionSlot>;

auto field_doc_slot(std::string_view source, size_t insert_line0, bool overwrite)
    -> std::optional<InsertionSlot>;

// True if any of lines [lo, hi) is a doc comment or doc attribute
auto has_doc_block_in_range(std::string_view source, size_t lo, size_t hi) -> bool;

// Dispatch by kind. nullopt means "existing documentation kept": the caller
// counts it apart from anchors that were never found.
auto resolve(std::string_view source, size_t anchor_line0, ItemKind kind, bool overwrite)
    -> std::optional<InsertionSlot>;

} // namespace insertion_resolver
} // namespace docpatch
