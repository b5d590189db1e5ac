#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace docpatch {

// Comment marker for every documentation line we emit or recognize
inline constexpr std::string_view kDocMarker = "///";

// Language declared on bare opening fences inside a doc block
inline constexpr std::string_view kFenceLanguage = "rust";

enum class ItemKind {
    FUNCTION,    // fn, async fn, extern "C" fn, ...
    STRUCT_TYPE, // struct declarations (anchored above their attributes)
    FIELD        // struct fields, positioned exactly by the caller
};

// One documentation item to apply to a source file
struct DocResult {
    ItemKind kind = ItemKind::FUNCTION;
    std::string file;
    std::optional<size_t> start_line;  // 1-based hint; absent => item is skipped
    std::string signature;             // Informational only
    std::string fqpath;                // e.g. "crate::module::item"
    std::string doc_text;              // Sanitized "///" block

    auto operator==(const DocResult& other) const -> bool = default;
};

// "fn"/"function" => FUNCTION, "struct" => STRUCT_TYPE, "field" => FIELD.
// Anything else falls back to FUNCTION, the most permissive matcher.
auto kind_from_string(std::string_view text) -> ItemKind;

auto kind_name(ItemKind kind) -> std::string;

// Last path segment of an fqpath ("a::b::foo" => "foo")
auto item_name(const DocResult& result) -> std::string;

} // namespace docpatch
