#include "docpatch/ui/ftxui_reporter.hpp"
#include "docpatch/ui/report.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sstream>

namespace docpatch {

using ::testing::HasSubstr;

class ReportTest : public ::testing::Test {
protected:
    //  0: use x;
    //  1: /// Old
    //  2: fn run() {}
    std::string original_ = "use x;\n/// Old\nfn run() {}\n";

    FilePatch patch_{
        .planned = {PlannedEdit{.item = "crate::run",
                                .kind = ItemKind::FUNCTION,
                                .anchor_line0 = 2,
                                .slot = InsertionSlot::replace(1, 2),
                                .edit = Edit{.start = 7, .end = 15, .text = "/// New\n/// Text\n"}}},
        .stats = PatchStats{.edits = 1},
    };

    std::vector<FileOutcome> outcomes_{
        FileOutcome{.file = "src/a.rs", .stats = PatchStats{.edits = 2, .skipped_existing_doc = 1}},
        FileOutcome{.file = "src/b.rs", .stats = PatchStats{.skipped_no_anchor = 3}},
        FileOutcome{.file = "src/c.rs", .failed = true, .error = "cannot open"},
    };
};

TEST_F(ReportTest, PreviewShowsRemovedAndInsertedLines)
{
    auto screen = compose_preview_screen("src/lib.rs", original_, patch_);

    ASSERT_EQ(screen.content.size(), 7);
    EXPECT_EQ(screen.content[0].text, "=== src/lib.rs ===");
    EXPECT_EQ(screen.content[2].text, "@@ line 2 (fn crate::run)");
    EXPECT_EQ(screen.content[3].text, "- /// Old");
    EXPECT_FALSE(screen.content[3].is_highlighted);
    EXPECT_EQ(screen.content[4].text, "+ /// New");
    EXPECT_TRUE(screen.content[4].is_highlighted);
    EXPECT_EQ(screen.content[5].text, "+ /// Text");
    EXPECT_EQ(screen.content[6].text, "  fn run() {}");
    EXPECT_EQ(screen.status_line, "Dry run: 1 planned edits");
}

TEST_F(ReportTest, SummaryHasRowPerFile)
{
    auto screen = compose_summary_screen(outcomes_, false);

    // Title, blank, top rule, header, separator, 3 rows, bottom rule
    ASSERT_EQ(screen.content.size(), 9);
    EXPECT_THAT(screen.content[5].text, HasSubstr("src/a.rs"));
    EXPECT_THAT(screen.content[5].text, HasSubstr("ok"));
    EXPECT_TRUE(screen.content[5].is_highlighted);
    EXPECT_FALSE(screen.content[6].is_highlighted);
    EXPECT_THAT(screen.content[7].text, HasSubstr("FAILED"));

    EXPECT_EQ(screen.status_line, "Applied 2 edits in 3 files | Failed: 1");
    EXPECT_EQ(screen.control_hints, "Skipped: 3 no anchor, 1 existing docs, 0 no line, 0 empty docs, "
                                     "0 duplicate");
}

TEST_F(ReportTest, SummaryRowsAlignWithRules)
{
    auto screen = compose_summary_screen(outcomes_, true);

    // Every table line has the same number of column separators
    for (size_t i = 2; i < screen.content.size(); ++i) {
        const auto& text = screen.content[i].text;
        size_t bars = 0;
        for (size_t pos = 0; (pos = text.find("│", pos)) != std::string::npos; pos += 3) {
            ++bars;
        }
        if (i == 3 || (i >= 5 && i <= 7)) {
            EXPECT_EQ(bars, 7) << text;
        }
    }
    EXPECT_THAT(screen.status_line, HasSubstr("Planned 2 edits"));
}

TEST_F(ReportTest, LongPathsKeepTheirTail)
{
    std::vector<FileOutcome> outcomes{
        FileOutcome{.file = "crates/very/deeply/nested/module/path/lib.rs"}};

    auto screen = compose_summary_screen(outcomes, false);

    EXPECT_THAT(screen.content[5].text, HasSubstr("...ed/module/path/lib.rs"));
}

TEST_F(ReportTest, TotalsAddUp)
{
    auto total = total_stats(outcomes_);

    EXPECT_EQ(total.edits, 2);
    EXPECT_EQ(total.skipped_no_anchor, 3);
    EXPECT_EQ(total.skipped_existing_doc, 1);
}

TEST_F(ReportTest, FtxuiRendersScreenText)
{
    Screen screen;
    screen.content.push_back(Line{.text = "plain line"});
    screen.content.push_back(Line{.text = "+ /// added", .is_highlighted = true});
    screen.status_line = "Status here";
    screen.control_hints = "Hints here";

    std::ostringstream out;
    FtxuiReporter reporter(out);
    reporter.display_screen(screen);

    EXPECT_THAT(out.str(), HasSubstr("plain line"));
    EXPECT_THAT(out.str(), HasSubstr("+ /// added"));
    EXPECT_THAT(out.str(), HasSubstr("Status here"));
    EXPECT_THAT(out.str(), HasSubstr("Hints here"));
}

} // namespace docpatch
