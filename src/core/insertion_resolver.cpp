#include "docpatch/core/insertion_resolver.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>
#include <vector>

namespace docpatch::insertion_resolver {

namespace {

using Lines = std::vector<std::string_view>;

// Attributes that are not themselves documentation
auto is_plain_attribute(std::string_view line) -> bool {
    return is_attribute_line(line) && !is_doc_or_doc_attr(line);
}

// Index of the first line of the contiguous doc block ending at from - 1,
// or `from` when there is none
auto walk_up_docs(const Lines& lines, size_t from) -> size_t {
    size_t i = from;
    while (i > 0 && i - 1 < lines.size() && is_doc_or_doc_attr(lines[i - 1])) {
        --i;
    }
    return i;
}

auto walk_up_attributes(const Lines& lines, size_t from) -> size_t {
    size_t i = from;
    while (i > 0 && i - 1 < lines.size() && is_plain_attribute(lines[i - 1])) {
        --i;
    }
    return i;
}

} // namespace

auto function_doc_range(std::string_view source, size_t sig_line0) -> std::pair<size_t, size_t> {
    auto lines = split_lines(source);

    size_t lo = walk_up_docs(lines, sig_line0);

    size_t attr_top = walk_up_attributes(lines, sig_line0);
    if (attr_top < sig_line0) {
        // Docs live above the attributes; the new block must touch the
        // first attribute with no blank line in between
        lo = std::min(lo, walk_up_docs(lines, attr_top));
        return {lo, attr_top};
    }

    if (sig_line0 > 0 && sig_line0 - 1 < lines.size() && is_blank(lines[sig_line0 - 1])) {
        lo = std::min(lo, sig_line0 - 1);
    }
    return {lo, sig_line0};
}

auto struct_doc_slot(std::string_view source, size_t struct_line0, bool overwrite)
    -> std::optional<InsertionSlot> {
    auto lines = split_lines(source);

    size_t anchor = struct_line0;
    size_t i = struct_line0;
    bool saw_attr = false;
    bool absorbed_blank = false;

    while (i > 0 && i - 1 < lines.size()) {
        auto line = lines[i - 1];
        if (is_plain_attribute(line)) {
            saw_attr = true;
            absorbed_blank = false;
            anchor = i - 1;
            --i;
            continue;
        }
        // At most one blank line between attribute groups
        if (saw_attr && !absorbed_blank && is_blank(line)) {
            absorbed_blank = true;
            --i;
            continue;
        }
        break;
    }

    if (anchor > 0 && anchor - 1 < lines.size() && is_doc_or_doc_attr(lines[anchor - 1])) {
        if (!overwrite) {
            return std::nullopt;
        }
        return InsertionSlot::replace(walk_up_docs(lines, anchor), anchor);
    }
    return InsertionSlot::before(anchor);
}

auto field_doc_slot(std::string_view source, size_t insert_line0, bool overwrite)
    -> std::optional<InsertionSlot> {
    if (insert_line0 == 0) {
        return InsertionSlot::before(0);
    }

    auto lines = split_lines(source);
    size_t above = insert_line0 - 1;

    if (above < lines.size() && is_doc_or_doc_attr(lines[above])) {
        if (!overwrite) {
            return std::nullopt;
        }
        return InsertionSlot::replace(walk_up_docs(lines, insert_line0), insert_line0);
    }
    return InsertionSlot::before(insert_line0);
}

auto has_doc_block_in_range(std::string_view source, size_t lo, size_t hi) -> bool {
    auto lines = split_lines(source);
    hi = std::min(hi, lines.size());

    for (size_t k = lo; k < hi; ++k) {
        if (is_doc_or_doc_attr(lines[k])) {
            return true;
        }
    }
    return false;
}

auto resolve(std::string_view source, size_t anchor_line0, ItemKind kind, bool overwrite)
    -> std::optional<InsertionSlot> {
    switch (kind) {
    case ItemKind::STRUCT_TYPE:
        return struct_doc_slot(source, anchor_line0, overwrite);

    case ItemKind::FIELD:
        return field_doc_slot(source, anchor_line0, overwrite);

    case ItemKind::FUNCTION: {
        auto [lo, hi] = function_doc_range(source, anchor_line0);
        if (!overwrite && has_doc_block_in_range(source, lo, hi)) {
            return std::nullopt;
        }
        if (lo == hi) {
            return InsertionSlot::before(lo);
        }
        return InsertionSlot::replace(lo, hi);
    }
    }
    return std::nullopt;
}

} // namespace docpatch::insertion_resolver
