#include "docpatch/core/struct_fields.hpp"
#include <gtest/gtest.h>

namespace docpatch {

class StructFieldsTest : public ::testing::Test {
protected:
    //  0: #[derive(Debug)]
    //  1: pub struct Config {
    //  2:     /// Display name.
    //  3:     pub name: String,
    //  4:     #[serde(default)]
    //  5:     #[serde(rename = "n")]
    //  6:     pub retries: u32,
    //  7:     r#type: Kind,
    //  8:     inner: Vec<Option<u8>>,
    //  9: }
    // 10:
    // 11: pub struct Unit;
    // 12: pub struct Inline { a: u8 }
    std::string source_ = "#[derive(Debug)]\n"
                          "pub struct Config {\n"
                          "    /// Display name.\n"
                          "    pub name: String,\n"
                          "    #[serde(default)]\n"
                          "    #[serde(rename = \"n\")]\n"
                          "    pub retries: u32,\n"
                          "    r#type: Kind,\n"
                          "    inner: Vec<Option<u8>>,\n"
                          "}\n"
                          "\n"
                          "pub struct Unit;\n"
                          "pub struct Inline { a: u8 }\n";
};

TEST_F(StructFieldsTest, FindsBracedBody)
{
    EXPECT_EQ(find_struct_body(source_, 1), (StructBody{.open_line = 1, .close_line = 9}));
    EXPECT_EQ(find_struct_body(source_, 0), (StructBody{.open_line = 1, .close_line = 9}));
}

TEST_F(StructFieldsTest, UnitStructHasNoBody)
{
    EXPECT_EQ(find_struct_body(source_, 11), std::nullopt);
    EXPECT_TRUE(fields_of_struct(source_, 11).empty());
}

TEST_F(StructFieldsTest, SingleLineBody)
{
    EXPECT_EQ(find_struct_body(source_, 12), (StructBody{.open_line = 12, .close_line = 12}));
    EXPECT_TRUE(fields_of_struct(source_, 12).empty());
}

TEST_F(StructFieldsTest, ExtractsFieldsWithInsertionLines)
{
    auto fields = fields_of_struct(source_, 1);

    ASSERT_EQ(fields.size(), 4);

    EXPECT_EQ(fields[0].name, "name");
    EXPECT_EQ(fields[0].field_line0, 3);
    EXPECT_EQ(fields[0].insert_line0, 3);
    EXPECT_EQ(fields[0].field_line_text, "    pub name: String,");

    EXPECT_EQ(fields[1].name, "retries");
    EXPECT_EQ(fields[1].field_line0, 6);
    EXPECT_EQ(fields[1].insert_line0, 4);

    EXPECT_EQ(fields[2].name, "type");
    EXPECT_EQ(fields[3].name, "inner");
}

TEST_F(StructFieldsTest, MissingCloseBraceIsNoBody)
{
    EXPECT_EQ(find_struct_body("struct S {\n    a: u8,\n", 0), std::nullopt);
}

} // namespace docpatch
