#include "docpatch/parsers/doc_result_parser.hpp"
#include "docpatch/core/anchor_locator.hpp"
#include "docpatch/core/sanitizer.hpp"
#include "docpatch/core/source_text.hpp"
#include "docpatch/core/struct_fields.hpp"
#include "docpatch/errors.hpp"
#include <algorithm>
#include <iostream>

namespace docpatch {

DocResultParser::DocResultParser(IFileSystem& filesystem) : filesystem_(filesystem) {}

auto DocResultParser::parse_results(const std::string& json_text) -> std::vector<DocResult> {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("invalid results JSON: ") + e.what());
    }

    if (!document.is_array()) {
        throw ParseError("results JSON must be an array of items");
    }

    source_cache_.clear();
    std::vector<DocResult> results;

    for (size_t index = 0; index < document.size(); ++index) {
        const auto& entry = document[index];
        try {
            auto result = parse_entry(entry);

            if (result.kind == ItemKind::STRUCT_TYPE && entry.contains("fields")) {
                auto fields = expand_fields(entry.at("fields"), result);
                results.push_back(std::move(result));
                results.insert(results.end(), std::make_move_iterator(fields.begin()),
                               std::make_move_iterator(fields.end()));
            } else {
                results.push_back(std::move(result));
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "Warning: skipping results entry " << index << ": " << e.what() << '\n';
        }
    }

    return results;
}

auto DocResultParser::parse_entry(const nlohmann::json& entry) -> DocResult {
    DocResult result{
        .kind = kind_from_string(entry.value("kind", std::string("fn"))),
        .file = entry.at("file").get<std::string>(),
        .start_line = std::nullopt,
        .signature = entry.value("signature", std::string()),
        .fqpath = entry.value("fqpath", std::string()),
        .doc_text = doc_text_of(entry, "llm_doc", "raw_doc"),
    };

    if (entry.contains("start_line") && !entry.at("start_line").is_null()) {
        result.start_line = entry.at("start_line").get<size_t>();
    }

    return result;
}

auto DocResultParser::expand_fields(const nlohmann::json& fields, const DocResult& parent)
    -> std::vector<DocResult> {
    std::vector<DocResult> expanded;
    if (!fields.is_array() || fields.empty()) {
        return expanded;
    }
    if (!parent.start_line) {
        std::cerr << "Warning: struct " << parent.fqpath << " has no start line; fields skipped\n";
        return expanded;
    }

    std::vector<FieldSpec> specs;
    try {
        const auto& source = source_for(parent.file);
        size_t approx = *parent.start_line > 0 ? *parent.start_line - 1 : 0;
        auto anchor = anchor_locator::find_anchor(source, approx, ItemKind::STRUCT_TYPE);
        if (!anchor) {
            std::cerr << "Warning: struct " << parent.fqpath << " not found in " << parent.file
                      << "; fields skipped\n";
            return expanded;
        }
        specs = fields_of_struct(source, *anchor);
    } catch (const FileError& e) {
        std::cerr << "Warning: fields of " << parent.fqpath << " skipped: " << e.what() << '\n';
        return expanded;
    }

    for (const auto& field : fields) {
        auto name = field.at("name").get<std::string>();
        auto spec = std::find_if(specs.begin(), specs.end(),
                                 [&name](const FieldSpec& s) { return s.name == name; });
        if (spec == specs.end()) {
            std::cerr << "Warning: field " << name << " not found in struct " << parent.fqpath
                      << '\n';
            continue;
        }

        expanded.push_back(DocResult{
            .kind = ItemKind::FIELD,
            .file = parent.file,
            .start_line = spec->insert_line0 + 1,
            .signature = std::string(trim(spec->field_line_text)),
            .fqpath = parent.fqpath + "::" + name,
            .doc_text = doc_text_of(field, "llm_doc", "doc"),
        });
    }

    return expanded;
}

auto DocResultParser::source_for(const std::string& path) -> const std::string& {
    auto it = source_cache_.find(path);
    if (it == source_cache_.end()) {
        it = source_cache_.emplace(path, filesystem_.read_file(path)).first;
    }
    return it->second;
}

auto DocResultParser::doc_text_of(const nlohmann::json& entry, const char* doc_key,
                                  const char* raw_key) -> std::string {
    // Pre-sanitized text wins; raw generator output is cleaned here
    if (entry.contains(doc_key) && entry.at(doc_key).is_string()) {
        return entry.at(doc_key).get<std::string>();
    }
    if (entry.contains(raw_key) && entry.at(raw_key).is_string()) {
        return sanitize(entry.at(raw_key).get<std::string>());
    }
    return "";
}

} // namespace docpatch
