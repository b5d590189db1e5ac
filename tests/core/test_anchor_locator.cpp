#include "docpatch/core/anchor_locator.hpp"
#include <gtest/gtest.h>

namespace docpatch::anchor_locator {

class AnchorLocatorTest : public ::testing::Test {
protected:
    //  0: use std::fmt::Debug;
    //  1:
    //  2: #[allow(dead_code)]
    //  3: #[inline]
    //  4: pub fn alpha() {}
    //  5:
    //  6: mod something {
    //  7: }
    //  8: fn beta() {}
    //  9:
    // 10: pub struct S {}
    std::string source_ = "use std::fmt::Debug;\n"
                          "\n"
                          "#[allow(dead_code)]\n"
                          "#[inline]\n"
                          "pub fn alpha() {}\n"
                          "\n"
                          "mod something {\n"
                          "}\n"
                          "fn beta() {}\n"
                          "\n"
                          "pub struct S {}";
};

TEST_F(AnchorLocatorTest, FindsForwardWithinWindow)
{
    EXPECT_EQ(find_line_near(source_, 1, function_pattern()), 4);
}

TEST_F(AnchorLocatorTest, ScansBackwardWhenNothingAhead)
{
    std::regex mod_pattern{R"(^\s*mod\b)"};
    EXPECT_EQ(find_line_near(source_, 7, mod_pattern), 6);
}

TEST_F(AnchorLocatorTest, NoMatchInWindow)
{
    std::regex enum_pattern{R"(^\s*enum\b)"};
    EXPECT_EQ(find_line_near(source_, 0, enum_pattern), std::nullopt);
}

TEST_F(AnchorLocatorTest, StartPastEndOfSource)
{
    EXPECT_EQ(find_line_near(source_, 100, function_pattern()), std::nullopt);
}

TEST_F(AnchorLocatorTest, MatchesExactStartLine)
{
    EXPECT_EQ(find_line_near(source_, 8, function_pattern()), 8);
}

TEST_F(AnchorLocatorTest, BackwardWindowIsFiveLines)
{
    std::string source = "fn early() {}\n";
    for (int i = 0; i < 30; ++i) {
        source += "let x = 1;\n";
    }

    // fn on line 0: reachable from 5, not from 6 (forward window finds nothing)
    EXPECT_EQ(find_line_near(source, 5, function_pattern()), 0);
    EXPECT_EQ(find_line_near(source, 6, function_pattern()), std::nullopt);
}

TEST_F(AnchorLocatorTest, ForwardWindowIsTwentyLines)
{
    std::string source;
    for (int i = 0; i < 20; ++i) {
        source += "let x = 1;\n";
    }
    source += "fn late() {}\n";

    EXPECT_EQ(find_line_near(source, 1, function_pattern()), 20);
    EXPECT_EQ(find_line_near(source, 0, function_pattern()), std::nullopt);
}

TEST_F(AnchorLocatorTest, FunctionPatternAcceptsQualifiers)
{
    EXPECT_TRUE(matches("pub(crate) async fn run() {}", function_pattern()));
    EXPECT_TRUE(matches("    pub const unsafe fn raw() {}", function_pattern()));
    EXPECT_TRUE(matches("extern \"C\" fn callback() {}", function_pattern()));
    EXPECT_FALSE(matches("let fnord = 1;", function_pattern()));
    EXPECT_FALSE(matches("// fn commented()", function_pattern()));
}

TEST_F(AnchorLocatorTest, StructAndFieldPatterns)
{
    EXPECT_TRUE(matches("pub(super) struct Wrapper(u8);", struct_pattern()));
    EXPECT_FALSE(matches("let structure = 1;", struct_pattern()));

    EXPECT_TRUE(matches("    pub name: String,", field_pattern()));
    EXPECT_TRUE(matches("    r#type: Kind", field_pattern()));
    EXPECT_FALSE(matches("    inner: Inner {", field_pattern()));
    EXPECT_FALSE(matches("    let x: u32 = 1;", field_pattern()));

    EXPECT_TRUE(matches("  #[serde(default)]", attribute_pattern()));
}

TEST_F(AnchorLocatorTest, StructAnchorUsesStructPattern)
{
    EXPECT_EQ(find_anchor(source_, 7, ItemKind::STRUCT_TYPE), 10);
    EXPECT_EQ(find_anchor(source_, 0, ItemKind::FUNCTION), 4);
}

TEST_F(AnchorLocatorTest, FieldAnchorIsExact)
{
    EXPECT_EQ(find_anchor(source_, 3, ItemKind::FIELD), 3);
}

TEST_F(AnchorLocatorTest, FieldAnchorPastEndOfFile)
{
    std::string source = "struct S {\n    a: i32,\n}\n";

    EXPECT_EQ(find_anchor(source, 2, ItemKind::FIELD), 2);
    EXPECT_EQ(find_anchor(source, 3, ItemKind::FIELD), std::nullopt);
    EXPECT_EQ(find_anchor(source, 39, ItemKind::FIELD), std::nullopt);
}

} // namespace docpatch::anchor_locator
