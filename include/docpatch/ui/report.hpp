#pragma once

#include "docpatch/core/patch_planner.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

struct Line {
    std::string text;
    bool is_highlighted = false;
};

struct Screen {
    std::vector<Line> content;
    std::string status_line;
    std::string control_hints;
};

// Result of one file's pass
struct FileOutcome {
    std::string file;
    PatchStats stats;
    bool failed = false;
    std::string error;
};

// Dry-run view of one file: every planned edit with the lines it removes,
// the lines it inserts (highlighted) and the anchor line below them.
auto compose_preview_screen(const std::string& file, std::string_view original,
                            const FilePatch& patch) -> Screen;

auto compose_summary_screen(const std::vector<FileOutcome>& outcomes, bool dry_run) -> Screen;

auto total_stats(const std::vector<FileOutcome>& outcomes) -> PatchStats;

} // namespace docpatch
