#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

// Split on '\n', dropping one trailing '\r' per line. A trailing newline does
// not produce a final empty line, so "a\nb\n" and "a\nb" both have 2 lines.
auto split_lines(std::string_view text) -> std::vector<std::string_view>;

// Byte offset of every line start plus a sentinel at text.size().
// Always split_lines(text).size() + 1 entries.
auto compute_line_starts(std::string_view text) -> std::vector<size_t>;

// Join lines [lo, hi] (inclusive) with '\n'
auto extract_lines(std::string_view text, size_t lo_line0, size_t hi_line0) -> std::string;

// Leading spaces/tabs of a line ("" for blank lines)
auto extract_indentation(std::string_view line) -> std::string;

auto trim(std::string_view text) -> std::string_view;
auto trim_start(std::string_view text) -> std::string_view;
auto trim_end(std::string_view text) -> std::string_view;
auto is_blank(std::string_view line) -> bool;

// Line classification used by the resolver and field walker
auto is_doc_line(std::string_view line) -> bool;        // "///"
auto is_doc_or_doc_attr(std::string_view line) -> bool; // "///", "#[doc", "#![doc"
auto is_attribute_line(std::string_view line) -> bool;  // "#[", "#!["

} // namespace docpatch
