#pragma once

#include "docpatch/core/doc_result.hpp"
#include "docpatch/interfaces.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace docpatch {

// Reads the results document: a JSON array of documented items. Struct
// entries may carry per-field docs, resolved against the struct's file.
class DocResultParser : public IDocResultParser {
private:
    IFileSystem& filesystem_;
    std::map<std::string, std::string> source_cache_; // Per parse_results call

public:
    explicit DocResultParser(IFileSystem& filesystem);

    auto parse_results(const std::string& json_text) -> std::vector<DocResult> override;

private:
    auto parse_entry(const nlohmann::json& entry) -> DocResult;
    auto expand_fields(const nlohmann::json& fields, const DocResult& parent)
        -> std::vector<DocResult>;
    auto source_for(const std::string& path) -> const std::string&;

    static auto doc_text_of(const nlohmann::json& entry, const char* doc_key, const char* raw_key)
        -> std::string;
};

} // namespace docpatch
