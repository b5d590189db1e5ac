#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

// Tunable parts of the sanitizer. The leftover-line denylist was tuned
// against observed generator output and is not exhaustive.
struct SanitizeRules {
    // <tag ...>...</tag> regions removed entirely (case-insensitive)
    std::vector<std::string> wrapper_tags{"think"};

    // Label prefixes; everything up to the first one is dropped
    std::vector<std::string> prefix_markers{"ANSWER:", "RESPONSE:", "OUTPUT:", "QUESTION:"};

    // Bare "Label:" lines rewritten as "## Label"
    std::vector<std::string> section_labels{"Parameters", "Returns", "Errors",
                                            "Safety",     "Notes",   "Examples"};

    // Exact trimmed lines treated as structured-data leftovers
    std::vector<std::string> dropped_lines{"{", "}", "},"};

    // Drop lines ending in ':' (JSON keys, dangling labels)
    bool drop_trailing_colon = true;

    // Strip one layer of surrounding double quotes
    bool unquote_lines = true;
};

// Turn free-form generated text into a contiguous "///" block. Never fails;
// the worst case is an empty string.
auto sanitize(std::string_view raw) -> std::string;
auto sanitize(std::string_view raw, const SanitizeRules& rules) -> std::string;

// Individual stages, in pipeline order
namespace sanitizer {

auto strip_wrapper_regions(std::string_view text, std::string_view tag) -> std::string;

// At least three lines already carry the doc marker
auto looks_like_doc_block(std::string_view text) -> bool;

auto strip_prefix_markers(std::string_view text, const std::vector<std::string>& markers)
    -> std::string;

auto unwrap_code_fence(std::string_view text) -> std::string;

auto decode_common_escapes(std::string_view text) -> std::string;

auto map_section_labels(std::vector<std::string> lines, const std::vector<std::string>& labels)
    -> std::vector<std::string>;

auto coerce_to_doc_lines(const std::vector<std::string>& lines, const SanitizeRules& rules)
    -> std::vector<std::string>;

auto extract_longest_doc_block(const std::vector<std::string>& lines) -> std::vector<std::string>;

auto normalize_fences(std::vector<std::string> lines) -> std::vector<std::string>;

auto trim_blank_doc_lines(std::vector<std::string> lines) -> std::vector<std::string>;

} // namespace sanitizer
} // namespace docpatch
