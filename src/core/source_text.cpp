#include "docpatch/core/source_text.hpp"
#include "docpatch/core/doc_result.hpp"

namespace docpatch {

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t pos = 0;

    while (pos < text.size()) {
        auto newline = text.find('\n', pos);
        auto end = newline == std::string_view::npos ? text.size() : newline;
        auto line = text.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        pos = newline + 1;
    }

    return lines;
}

auto compute_line_starts(std::string_view text) -> std::vector<size_t> {
    std::vector<size_t> starts{0};
    for (size_t i = 0; i < text.size(); ++i) {
        // A newline in last position does not open another line
        if (text[i] == '\n' && i + 1 < text.size()) {
            starts.push_back(i + 1);
        }
    }
    if (!text.empty()) {
        starts.push_back(text.size());
    }
    return starts;
}

auto extract_lines(std::string_view text, size_t lo_line0, size_t hi_line0) -> std::string {
    auto lines = split_lines(text);
    std::string out;

    for (size_t i = lo_line0; i <= hi_line0 && i < lines.size(); ++i) {
        if (i > lo_line0) {
            out += '\n';
        }
        out += lines[i];
    }

    return out;
}

auto extract_indentation(std::string_view line) -> std::string {
    auto first_non_space = line.find_first_not_of(" \t");
    if (first_non_space == std::string_view::npos) {
        return "";
    }
    return std::string(line.substr(0, first_non_space));
}

auto trim(std::string_view text) -> std::string_view {
    return trim_end(trim_start(text));
}

auto trim_start(std::string_view text) -> std::string_view {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    return text.substr(start);
}

auto trim_end(std::string_view text) -> std::string_view {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos) {
        return {};
    }
    return text.substr(0, end + 1);
}

auto is_blank(std::string_view line) -> bool {
    return trim(line).empty();
}

auto is_doc_line(std::string_view line) -> bool {
    return trim_start(line).starts_with(kDocMarker);
}

auto is_doc_or_doc_attr(std::string_view line) -> bool {
    auto t = trim_start(line);
    return t.starts_with(kDocMarker) || t.starts_with("#![doc") || t.starts_with("#[doc");
}

auto is_attribute_line(std::string_view line) -> bool {
    auto t = trim_start(line);
    return t.starts_with("#[") || t.starts_with("#![");
}

} // namespace docpatch
