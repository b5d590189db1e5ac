#include "docpatch/ui/report.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>

namespace docpatch {

namespace {

constexpr size_t kFileColumnWidth = 24;

auto pad_right(std::string text, size_t width) -> std::string {
    if (text.size() < width) {
        text += std::string(width - text.size(), ' ');
    }
    return text;
}

auto pad_left(const std::string& text, size_t width) -> std::string {
    if (text.size() >= width) {
        return text;
    }
    return std::string(width - text.size(), ' ') + text;
}

// Keep the tail of long paths, it is the part that identifies the file
auto fit_path(const std::string& path, size_t width) -> std::string {
    if (path.size() <= width) {
        return path;
    }
    return "..." + path.substr(path.size() - (width - 3));
}

// Widths between the column separators
constexpr size_t kColumnWidths[] = {kFileColumnWidth + 2, 7, 11, 10, 9, 8};

auto table_row(const std::string& file, const std::string& edits, const std::string& no_anchor,
               const std::string& existing, const std::string& no_text, const std::string& status)
    -> std::string {
    return "│ " + pad_right(fit_path(file, kFileColumnWidth), kFileColumnWidth) + " │"
           + pad_left(edits, 6) + " │" + pad_left(no_anchor, 10) + " │" + pad_left(existing, 9)
           + " │" + pad_left(no_text, 8) + " │ " + pad_right(status, 7) + "│";
}

auto table_rule(const std::string& left, const std::string& middle, const std::string& right)
    -> std::string {
    std::string rule = left;
    bool first = true;
    for (auto width : kColumnWidths) {
        if (!first) {
            rule += middle;
        }
        first = false;
        for (size_t i = 0; i < width; ++i) {
            rule += "─";
        }
    }
    return rule + right;
}

auto summary_row(const FileOutcome& outcome) -> std::string {
    const auto& stats = outcome.stats;
    std::string status = outcome.failed ? "FAILED" : (stats.edits > 0 ? "ok" : "-");
    return table_row(outcome.file, std::to_string(stats.edits),
                     std::to_string(stats.skipped_no_anchor),
                     std::to_string(stats.skipped_existing_doc),
                     std::to_string(stats.skipped_no_line + stats.skipped_empty_doc), status);
}

} // namespace

auto total_stats(const std::vector<FileOutcome>& outcomes) -> PatchStats {
    PatchStats total;
    for (const auto& outcome : outcomes) {
        total += outcome.stats;
    }
    return total;
}

auto compose_preview_screen(const std::string& file, std::string_view original,
                            const FilePatch& patch) -> Screen {
    Screen screen;
    auto lines = split_lines(original);

    screen.content.push_back(Line{.text = "=== " + file + " ==="});

    for (const auto& planned : patch.planned) {
        screen.content.push_back(Line{.text = ""});
        screen.content.push_back(
            Line{.text = "@@ line " + std::to_string(planned.slot.lo + 1) + " ("
                         + kind_name(planned.kind) + " " + planned.item + ")"});

        for (size_t i = planned.slot.lo; i < planned.slot.hi && i < lines.size(); ++i) {
            screen.content.push_back(Line{.text = "- " + std::string(lines[i])});
        }
        for (auto inserted : split_lines(planned.edit.text)) {
            screen.content.push_back(Line{.text = "+ " + std::string(inserted), .is_highlighted = true});
        }
        if (planned.anchor_line0 < lines.size()) {
            screen.content.push_back(Line{.text = "  " + std::string(lines[planned.anchor_line0])});
        }
    }

    screen.status_line = "Dry run: " + std::to_string(patch.stats.edits) + " planned edits";
    screen.control_hints = "Nothing written. Re-run without --dry-run to apply.";
    return screen;
}

auto compose_summary_screen(const std::vector<FileOutcome>& outcomes, bool dry_run) -> Screen {
    Screen screen;

    screen.content.push_back(Line{.text = "=== Documentation Patch Summary ==="});
    screen.content.push_back(Line{.text = ""});

    screen.content.push_back(Line{.text = table_rule("┌", "┬", "┐")});
    screen.content.push_back(
        Line{.text = table_row("File", "Edits", "No anchor", "Existing", "No text", "Status")});
    screen.content.push_back(Line{.text = table_rule("├", "┼", "┤")});

    for (const auto& outcome : outcomes) {
        screen.content.push_back(Line{.text = summary_row(outcome),
                                      .is_highlighted = !outcome.failed && outcome.stats.edits > 0});
    }

    screen.content.push_back(Line{.text = table_rule("└", "┴", "┘")});

    auto total = total_stats(outcomes);
    auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                [](const FileOutcome& o) { return o.failed; });

    screen.status_line = std::string(dry_run ? "Planned " : "Applied ") + std::to_string(total.edits)
                         + " edits in " + std::to_string(outcomes.size()) + " files | Failed: "
                         + std::to_string(failed);
    screen.control_hints = "Skipped: " + std::to_string(total.skipped_no_anchor) + " no anchor, "
                           + std::to_string(total.skipped_existing_doc) + " existing docs, "
                           + std::to_string(total.skipped_no_line) + " no line, "
                           + std::to_string(total.skipped_empty_doc) + " empty docs, "
                           + std::to_string(total.skipped_duplicate) + " duplicate";
    return screen;
}

} // namespace docpatch
