#include "docpatch/core/edit_applier.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>

namespace docpatch {

auto apply_edits(std::string text, std::vector<Edit> edits) -> std::string {
    std::stable_sort(edits.begin(), edits.end(),
                     [](const Edit& a, const Edit& b) { return a.start > b.start; });

    for (const auto& edit : edits) {
        if (edit.start > edit.end || edit.end > text.size()) {
            continue;
        }
        text.replace(edit.start, edit.end - edit.start, edit.text);
    }
    return text;
}

auto indent_like(std::string_view target_line, std::string_view doc) -> std::string {
    auto indent = extract_indentation(target_line);
    std::string out;

    for (auto raw : split_lines(doc)) {
        auto line = trim_end(raw);
        auto body = trim_start(line);

        out += indent;
        if (body.starts_with(kDocMarker)) {
            out += body;
        } else if (body.empty()) {
            out += kDocMarker;
        } else {
            out += kDocMarker;
            out += ' ';
            out += line;
        }
        out += '\n';
    }

    out.erase(std::remove(out.begin(), out.end(), '\r'), out.end());
    if (out.empty()) {
        out = "\n";
    }
    return out;
}

auto needs_leading_blank_line(std::string_view source, size_t line0) -> bool {
    if (line0 == 0) {
        return false;
    }
    auto lines = split_lines(source);
    if (line0 - 1 >= lines.size()) {
        return false;
    }
    return !is_blank(lines[line0 - 1]);
}

auto add_leading_blank_if_needed(std::string_view source, size_t line0, std::string block)
    -> std::string {
    if (needs_leading_blank_line(source, line0)) {
        block.insert(block.begin(), '\n');
    }
    return block;
}

auto build_replacement(std::string_view source, const InsertionSlot& slot, size_t anchor_line0,
                       ItemKind kind, std::string_view doc) -> std::string {
    size_t indent_line = anchor_line0;
    switch (kind) {
    case ItemKind::STRUCT_TYPE:
        indent_line = std::min(slot.hi, anchor_line0);
        break;
    case ItemKind::FIELD:
        indent_line = slot.hi;
        break;
    case ItemKind::FUNCTION:
        break;
    }

    auto lines = split_lines(source);
    std::string_view target = indent_line < lines.size() ? lines[indent_line] : std::string_view{};
    auto block = indent_like(target, doc);

    if (kind == ItemKind::FIELD) {
        return block;
    }
    return add_leading_blank_if_needed(source, slot.lo, std::move(block));
}

} // namespace docpatch
