#include "docpatch/core/doc_result.hpp"

namespace docpatch {

auto kind_from_string(std::string_view text) -> ItemKind {
    if (text == "struct") {
        return ItemKind::STRUCT_TYPE;
    }
    if (text == "field") {
        return ItemKind::FIELD;
    }
    return ItemKind::FUNCTION;
}

auto kind_name(ItemKind kind) -> std::string {
    switch (kind) {
    case ItemKind::FUNCTION:
        return "fn";
    case ItemKind::STRUCT_TYPE:
        return "struct";
    case ItemKind::FIELD:
        return "field";
    }
    return "fn";
}

auto item_name(const DocResult& result) -> std::string {
    auto pos = result.fqpath.rfind("::");
    if (pos == std::string::npos) {
        return result.fqpath;
    }
    return result.fqpath.substr(pos + 2);
}

} // namespace docpatch
