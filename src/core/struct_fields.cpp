#include "docpatch/core/struct_fields.hpp"
#include "docpatch/core/anchor_locator.hpp"
#include "docpatch/core/source_text.hpp"
#include <algorithm>
#include <regex>

namespace docpatch {

namespace {

auto field_name_pattern() -> const std::regex& {
    static const std::regex pattern{R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:r#)?([A-Za-z_][A-Za-z0-9_]*)\s*:)"};
    return pattern;
}

auto brace_delta(std::string_view text) -> int {
    int delta = 0;
    for (char c : text) {
        if (c == '{') {
            ++delta;
        } else if (c == '}') {
            --delta;
        }
    }
    return delta;
}

auto is_field_attribute(std::string_view line) -> bool {
    return anchor_locator::matches(line, anchor_locator::attribute_pattern())
           && !is_doc_or_doc_attr(line);
}

} // namespace

auto find_struct_body(std::string_view source, size_t struct_line0) -> std::optional<StructBody> {
    auto lines = split_lines(source);
    std::optional<size_t> open_line;
    int depth = 0;

    for (size_t i = struct_line0; i < lines.size(); ++i) {
        auto line = lines[i];
        if (!open_line) {
            auto brace = line.find('{');
            if (brace == std::string_view::npos) {
                // A ';' before any brace means a tuple or unit struct
                if (line.find(';') != std::string_view::npos) {
                    return std::nullopt;
                }
                continue;
            }
            open_line = i;
            depth = brace_delta(line.substr(brace));
        } else {
            depth += brace_delta(line);
        }

        if (depth <= 0) {
            return StructBody{.open_line = *open_line, .close_line = i};
        }
    }
    return std::nullopt;
}

auto extract_struct_fields(std::string_view source, const StructBody& body)
    -> std::vector<FieldSpec> {
    auto lines = split_lines(source);
    std::vector<FieldSpec> fields;

    size_t last = std::min(body.close_line, lines.size());
    size_t i = body.open_line + 1;

    while (i < last) {
        size_t attr_top = i;
        size_t j = i;
        while (j < last && is_field_attribute(lines[j])) {
            ++j;
        }

        if (j < last && anchor_locator::matches(lines[j], anchor_locator::field_pattern())) {
            std::match_results<std::string_view::const_iterator> match;
            auto line = lines[j];
            if (std::regex_search(line.begin(), line.end(), match, field_name_pattern())) {
                fields.push_back(FieldSpec{
                    .name = match[1].str(),
                    .field_line0 = j,
                    .insert_line0 = attr_top,
                    .field_line_text = std::string(line),
                });
            }
            i = j + 1;
            continue;
        }
        ++i;
    }

    return fields;
}

auto fields_of_struct(std::string_view source, size_t struct_line0) -> std::vector<FieldSpec> {
    auto body = find_struct_body(source, struct_line0);
    if (!body) {
        return {};
    }
    return extract_struct_fields(source, *body);
}

} // namespace docpatch
