#include "docpatch/core/patch_planner.hpp"
#include "docpatch/core/anchor_locator.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>

namespace docpatch {

namespace {

// Insertion point inside or on the edge of another slot's range
auto touches(const InsertionSlot& point, const InsertionSlot& range) -> bool {
    return point.lo == point.hi && range.lo <= point.lo && point.lo <= range.hi;
}

auto slots_conflict(const InsertionSlot& a, const InsertionSlot& b) -> bool {
    if (a.lo == b.lo || a.hi == b.hi || touches(a, b) || touches(b, a)) {
        return true;
    }
    return a.lo < b.hi && b.lo < a.hi;
}

auto conflicts_with_planned(const FilePatch& patch, size_t anchor, const InsertionSlot& slot)
    -> bool {
    return std::any_of(patch.planned.begin(), patch.planned.end(), [&](const PlannedEdit& p) {
        return p.anchor_line0 == anchor || slots_conflict(p.slot, slot);
    });
}

} // namespace

auto PatchStats::operator+=(const PatchStats& other) -> PatchStats& {
    edits += other.edits;
    skipped_no_anchor += other.skipped_no_anchor;
    skipped_existing_doc += other.skipped_existing_doc;
    skipped_no_line += other.skipped_no_line;
    skipped_empty_doc += other.skipped_empty_doc;
    skipped_duplicate += other.skipped_duplicate;
    return *this;
}

auto FilePatch::edits() const -> std::vector<Edit> {
    std::vector<Edit> result;
    result.reserve(planned.size());
    for (const auto& p : planned) {
        result.push_back(p.edit);
    }
    return result;
}

auto plan_file_patch(std::string_view original, std::span<const DocResult> items, bool overwrite)
    -> FilePatch {
    std::vector<const DocResult*> ordered;
    ordered.reserve(items.size());
    for (const auto& item : items) {
        ordered.push_back(&item);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const DocResult* a, const DocResult* b) {
        return a->start_line < b->start_line;
    });

    auto starts = compute_line_starts(original);
    size_t line_count = starts.size() - 1;

    FilePatch patch;
    for (const auto* item : ordered) {
        if (!item->start_line) {
            ++patch.stats.skipped_no_line;
            continue;
        }
        if (trim(item->doc_text).empty()) {
            ++patch.stats.skipped_empty_doc;
            continue;
        }

        size_t approx = *item->start_line > 0 ? *item->start_line - 1 : 0;
        auto anchor = anchor_locator::find_anchor(original, approx, item->kind);
        if (!anchor) {
            ++patch.stats.skipped_no_anchor;
            continue;
        }

        auto slot = insertion_resolver::resolve(original, *anchor, item->kind, overwrite);
        if (!slot) {
            ++patch.stats.skipped_existing_doc;
            continue;
        }

        if (conflicts_with_planned(patch, *anchor, *slot)) {
            ++patch.stats.skipped_duplicate;
            continue;
        }

        auto text = build_replacement(original, *slot, *anchor, item->kind, item->doc_text);
        patch.planned.push_back(PlannedEdit{
            .item = item->fqpath,
            .kind = item->kind,
            .anchor_line0 = *anchor,
            .slot = *slot,
            .edit = Edit{.start = starts[std::min(slot->lo, line_count)],
                         .end = starts[std::min(slot->hi, line_count)],
                         .text = std::move(text)},
        });
        ++patch.stats.edits;
    }

    return patch;
}

auto patch_text(std::string_view original, std::span<const DocResult> items, bool overwrite)
    -> std::string {
    auto patch = plan_file_patch(original, items, overwrite);
    return apply_edits(std::string(original), patch.edits());
}

} // namespace docpatch
