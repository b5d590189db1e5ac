#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch {

// Line span of a struct body: the line holding '{' and the line that closes it
struct StructBody {
    size_t open_line{};
    size_t close_line{};

    auto operator==(const StructBody& other) const -> bool = default;
};

struct FieldSpec {
    std::string name;
    size_t field_line0{};
    size_t insert_line0{}; // Topmost attribute above the field, or the field line
    std::string field_line_text;

    auto operator==(const FieldSpec& other) const -> bool = default;
};

auto find_struct_body(std::string_view source, size_t struct_line0) -> std::optional<StructBody>;

auto extract_struct_fields(std::string_view source, const StructBody& body)
    -> std::vector<FieldSpec>;

// Convenience: body lookup plus field extraction. Empty when the struct has
// no braced body (tuple and unit structs).
auto fields_of_struct(std::string_view source, size_t struct_line0) -> std::vector<FieldSpec>;

} // namespace docpatch
