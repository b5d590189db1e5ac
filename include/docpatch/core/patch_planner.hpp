#pragma once

#include "docpatch/core/doc_result.hpp"
#include "docpatch/core/edit_applier.hpp"
#include "docpatch/core/insertion_resolver.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

struct PatchStats {
    size_t edits{};
    size_t skipped_no_anchor{};
    size_t skipped_existing_doc{};
    size_t skipped_no_line{};
    size_t skipped_empty_doc{};
    size_t skipped_duplicate{};  // anchor or range already claimed by an earlier item

    auto operator==(const PatchStats& other) const -> bool = default;
    auto operator+=(const PatchStats& other) -> PatchStats&;
};

struct PlannedEdit {
    std::string item;  // fqpath of the documented item
    ItemKind kind = ItemKind::FUNCTION;
    size_t anchor_line0{};
    InsertionSlot slot;
    Edit edit;
};

struct FilePatch {
    std::vector<PlannedEdit> planned;
    PatchStats stats;

    auto edits() const -> std::vector<Edit>;
};

// Resolve every item against the unmodified text. Items are processed in
// start-line order; edit offsets all refer to `original`. An item whose
// anchor or slot collides with an already planned one is skipped, so the
// resulting edits never overlap.
auto plan_file_patch(std::string_view original, std::span<const DocResult> items, bool overwrite)
    -> FilePatch;

// plan_file_patch followed by apply_edits
auto patch_text(std::string_view original, std::span<const DocResult> items, bool overwrite)
    -> std::string;

} // namespace docpatch
