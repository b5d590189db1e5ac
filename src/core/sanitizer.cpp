#include "docpatch/core/sanitizer.hpp"
#include "docpatch/core/doc_result.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>
#include <optional>
#include <regex>

namespace docpatch {

namespace {

auto regex_escape(std::string_view text) -> std::string {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

auto replace_all(std::string text, std::string_view from, std::string_view to) -> std::string {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

auto join_lines(const std::vector<std::string>& lines) -> std::string {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

auto is_blank_doc_line(std::string_view line) -> bool {
    auto t = trim_end(line);
    return t.empty() || t == kDocMarker;
}

} // namespace

namespace sanitizer {

auto strip_wrapper_regions(std::string_view text, std::string_view tag) -> std::string {
    // Only the tags themselves go through the regex engine; the region body
    // can be arbitrarily long
    auto escaped = regex_escape(tag);
    const std::regex open_tag{"<\\s*" + escaped + "\\b", std::regex::ECMAScript | std::regex::icase};
    const std::regex close_tag{"</\\s*" + escaped + "\\s*>",
                               std::regex::ECMAScript | std::regex::icase};

    std::string out{text};
    size_t from = 0;
    while (from < out.size()) {
        std::smatch open;
        if (!std::regex_search(out.cbegin() + static_cast<std::ptrdiff_t>(from), out.cend(), open,
                               open_tag)) {
            break;
        }
        auto region_start = from + static_cast<size_t>(open.position(0));
        auto open_end = out.find('>', region_start + static_cast<size_t>(open.length(0)));
        if (open_end == std::string::npos) {
            break;
        }

        std::smatch close;
        if (!std::regex_search(out.cbegin() + static_cast<std::ptrdiff_t>(open_end + 1), out.cend(),
                               close, close_tag)) {
            // Unterminated region stays as written
            break;
        }
        auto region_end = open_end + 1 + static_cast<size_t>(close.position(0) + close.length(0));

        out.erase(region_start, region_end - region_start);
        from = region_start;
    }

    return std::string(trim(out));
}

auto looks_like_doc_block(std::string_view text) -> bool {
    auto lines = split_lines(text);
    auto doc_lines = std::count_if(lines.begin(), lines.end(),
                                   [](std::string_view l) { return is_doc_line(l); });
    return doc_lines >= 3;
}

auto strip_prefix_markers(std::string_view text, const std::vector<std::string>& markers)
    -> std::string {
    bool in_fence = false;
    size_t pos = 0;
    std::optional<size_t> split;

    while (pos <= text.size() && !split) {
        auto newline = text.find('\n', pos);
        auto end = newline == std::string_view::npos ? text.size() : newline;
        auto line = text.substr(pos, end - pos);
        auto trimmed = trim_start(line);

        if (trimmed.starts_with("```")) {
            in_fence = !in_fence;
        }
        if (!in_fence) {
            for (const auto& marker : markers) {
                if (trimmed.starts_with(marker)) {
                    split = pos + (line.size() - trimmed.size()) + marker.size();
                    break;
                }
            }
        }

        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }

    if (split) {
        return std::string(trim(text.substr(*split)));
    }
    return std::string(trim(text));
}

auto unwrap_code_fence(std::string_view text) -> std::string {
    auto raw_lines = split_lines(text);
    std::vector<std::string_view> lines;
    lines.reserve(raw_lines.size());
    size_t fence_count = 0;

    for (auto line : raw_lines) {
        auto l = trim_end(line);
        if (l.starts_with("```")) {
            ++fence_count;
        }
        lines.push_back(l);
    }

    auto non_empty = [](std::string_view l) { return !l.empty(); };
    auto first = std::find_if(lines.begin(), lines.end(), non_empty);
    auto last = std::find_if(lines.rbegin(), lines.rend(), non_empty);

    if (fence_count == 2 && first != lines.end() && first->starts_with("```")
        && last->starts_with("```")) {
        auto first_index = static_cast<size_t>(first - lines.begin());
        auto last_index = lines.size() - 1 - static_cast<size_t>(last - lines.rbegin());
        std::string inner;
        for (size_t i = first_index + 1; i < last_index; ++i) {
            if (i > first_index + 1) {
                inner += '\n';
            }
            inner += lines[i];
        }
        return inner;
    }

    // Not a single wrapped region: drop stray backticks at either end
    auto start = text.find_first_not_of('`');
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of('`');
    return std::string(trim(text.substr(start, end - start + 1)));
}

auto decode_common_escapes(std::string_view text) -> std::string {
    // Order matters: CRLF pairs first so "\r" never survives half-decoded
    std::string t{text};
    t = replace_all(std::move(t), R"(\r\n)", "\n");
    t = replace_all(std::move(t), R"(\n)", "\n");
    t = replace_all(std::move(t), R"(\t)", "\t");
    t = replace_all(std::move(t), R"(\")", "\"");
    t = replace_all(std::move(t), R"(\\n)", "\n");
    t = replace_all(std::move(t), R"(\\t)", "\t");
    t = replace_all(std::move(t), R"(\\")", "\"");
    return t;
}

auto map_section_labels(std::vector<std::string> lines, const std::vector<std::string>& labels)
    -> std::vector<std::string> {
    for (auto& line : lines) {
        auto t = trim(line);
        for (const auto& label : labels) {
            if (t.size() == label.size() + 1 && t.starts_with(label) && t.ends_with(':')) {
                line = "## " + label;
                break;
            }
        }
    }
    return lines;
}

auto coerce_to_doc_lines(const std::vector<std::string>& lines, const SanitizeRules& rules)
    -> std::vector<std::string> {
    std::vector<std::string> coerced;
    coerced.reserve(lines.size());
    bool prev_blank = false;

    for (const auto& line : lines) {
        std::string t{trim(line)};

        // Unprefixed fences belong to the wrapper, not to the doc block
        if (t.starts_with("```")) {
            continue;
        }

        if (t.empty()) {
            if (!prev_blank) {
                coerced.emplace_back(kDocMarker);
            }
            prev_blank = true;
            continue;
        }
        prev_blank = false;

        if (t.starts_with(kDocMarker)) {
            coerced.push_back(std::move(t));
            continue;
        }

        if (std::find(rules.dropped_lines.begin(), rules.dropped_lines.end(), t)
            != rules.dropped_lines.end()) {
            continue;
        }
        if (rules.drop_trailing_colon && t.ends_with(':')) {
            continue;
        }

        if (rules.unquote_lines && t.size() >= 2 && t.front() == '"' && t.back() == '"') {
            t = t.substr(1, t.size() - 2);
        }

        if (t.empty()) {
            coerced.emplace_back(kDocMarker);
        } else {
            coerced.push_back(std::string(kDocMarker) + " " + t);
        }
    }

    return coerced;
}

auto extract_longest_doc_block(const std::vector<std::string>& lines) -> std::vector<std::string> {
    size_t best_start = 0;
    size_t best_len = 0;
    size_t cur_start = 0;
    size_t cur_len = 0;

    for (size_t i = 0; i <= lines.size(); ++i) {
        if (i < lines.size() && is_doc_line(lines[i])) {
            if (cur_len == 0) {
                cur_start = i;
            }
            ++cur_len;
            continue;
        }
        // First run wins ties
        if (cur_len > best_len) {
            best_start = cur_start;
            best_len = cur_len;
        }
        cur_len = 0;
    }

    if (best_len == 0) {
        auto first = std::find_if(lines.begin(), lines.end(),
                                  [](const std::string& l) { return !is_blank(l); });
        if (first == lines.end()) {
            return {std::string(kDocMarker)};
        }
        if (first->starts_with(kDocMarker)) {
            return {*first};
        }
        return {std::string(kDocMarker) + " " + *first};
    }

    auto begin = lines.begin() + static_cast<std::ptrdiff_t>(best_start);
    return std::vector<std::string>(begin, begin + static_cast<std::ptrdiff_t>(best_len));
}

auto normalize_fences(std::vector<std::string> lines) -> std::vector<std::string> {
    bool open = false;

    for (auto& line : lines) {
        // A lone trailing backslash is a leftover line continuation
        if (line.ends_with('\\') && !line.ends_with("\\\\")) {
            line.pop_back();
        }

        auto t = trim_start(line);
        auto slashes = t.find_first_not_of('/');
        t = slashes == std::string_view::npos ? std::string_view{} : trim_start(t.substr(slashes));

        if (t.starts_with("```")) {
            if (!open && t == "```") {
                line = std::string(kDocMarker) + " ```" + std::string(kFenceLanguage);
            }
            open = !open;
        }
    }

    if (open) {
        lines.push_back(std::string(kDocMarker) + " ```");
    }
    return lines;
}

auto trim_blank_doc_lines(std::vector<std::string> lines) -> std::vector<std::string> {
    while (!lines.empty() && is_blank_doc_line(lines.back())) {
        lines.pop_back();
    }
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !is_blank_doc_line(l); });
    lines.erase(lines.begin(), first);
    return lines;
}

} // namespace sanitizer

auto sanitize(std::string_view raw) -> std::string {
    static const SanitizeRules default_rules{};
    return sanitize(raw, default_rules);
}

auto sanitize(std::string_view raw, const SanitizeRules& rules) -> std::string {
    using namespace sanitizer;

    std::string text{trim(raw)};
    for (const auto& tag : rules.wrapper_tags) {
        text = strip_wrapper_regions(text, tag);
    }

    if (!looks_like_doc_block(text)) {
        text = strip_prefix_markers(text, rules.prefix_markers);
    }

    text = unwrap_code_fence(text);
    text = decode_common_escapes(text);
    text.erase(std::remove(text.begin(), text.end(), '\r'), text.end());

    std::vector<std::string> lines;
    for (auto line : split_lines(text)) {
        lines.emplace_back(trim_end(line));
    }
    if (std::all_of(lines.begin(), lines.end(), [](const std::string& l) { return is_blank(l); })) {
        return "";
    }

    lines = map_section_labels(std::move(lines), rules.section_labels);
    auto block = extract_longest_doc_block(coerce_to_doc_lines(lines, rules));
    block = normalize_fences(std::move(block));
    block = trim_blank_doc_lines(std::move(block));

    return join_lines(block);
}

} // namespace docpatch
