#include "docpatch/application/docpatch_app.hpp"
#include "docpatch/errors.hpp"
#include "docpatch/io/file_system.hpp"
#include "docpatch/parsers/doc_result_parser.hpp"
#include "docpatch/ui/ftxui_reporter.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>

namespace docpatch {

namespace fs = std::filesystem;

class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir_ = fs::temp_directory_path()
               / ("docpatch_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed())
                  + "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
        source_path_ = (dir_ / "lib.rs").string();
        results_path_ = (dir_ / "results.json").string();

        write(source_path_, source_);
        write(results_path_, results_json().dump(2));
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static void write(const std::string& path, const std::string& content)
    {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    static auto read(const std::string& path) -> std::string
    {
        std::ifstream file(path, std::ios::binary);
        std::ostringstream oss;
        oss << file.rdbuf();
        return oss.str();
    }

    auto results_json() const -> nlohmann::json
    {
        return nlohmann::json::array({
            {
                {"kind", "fn"},
                {"file", source_path_},
                {"start_line", 3},
                {"end_line", 5},
                {"signature", "pub fn alpha() -> u32"},
                {"fqpath", "demo::alpha"},
                {"llm_doc", "/// Returns one."},
            },
            {
                {"kind", "struct"},
                {"file", source_path_},
                {"start_line", 8},
                {"signature", "pub struct Config"},
                {"fqpath", "demo::Config"},
                {"raw_doc", "<think>hmm</think>\nANSWER: Runtime settings."},
                {"fields", nlohmann::json::array({
                               {{"name", "name"}, {"doc", "Display name."}},
                               {{"name", "retries"}, {"doc", "\"Retry count.\""}},
                           })},
            },
        });
    }

    auto run_once(Config config) -> int
    {
        config.input_file = results_path_;

        auto filesystem = std::make_unique<FileSystem>();
        auto parser = std::make_unique<DocResultParser>(*filesystem);
        auto reporter = std::make_unique<FtxuiReporter>(report_);
        DocpatchApp app(std::move(filesystem), std::move(parser), std::move(reporter));

        std::ostringstream out;
        std::ostringstream err;
        std::streambuf* orig_out = std::cout.rdbuf(out.rdbuf());
        std::streambuf* orig_err = std::cerr.rdbuf(err.rdbuf());

        int result = app.run(config);

        std::cout.rdbuf(orig_out);
        std::cerr.rdbuf(orig_err);
        stdout_ = out.str();
        stderr_ = err.str();
        return result;
    }

    fs::path dir_;
    std::string source_path_;
    std::string results_path_;
    std::ostringstream report_;
    std::string stdout_;
    std::string stderr_;

    std::string source_ = "use std::io;\n"
                          "\n"
                          "pub fn alpha() -> u32 {\n"
                          "    1\n"
                          "}\n"
                          "\n"
                          "#[derive(Debug)]\n"
                          "pub struct Config {\n"
                          "    pub name: String,\n"
                          "    #[serde(default)]\n"
                          "    pub retries: u32,\n"
                          "}\n";

    std::string expected_ = "use std::io;\n"
                            "\n"
                            "/// Returns one.\n"
                            "pub fn alpha() -> u32 {\n"
                            "    1\n"
                            "}\n"
                            "\n"
                            "/// Runtime settings.\n"
                            "#[derive(Debug)]\n"
                            "pub struct Config {\n"
                            "    /// Display name.\n"
                            "    pub name: String,\n"
                            "    /// Retry count.\n"
                            "    #[serde(default)]\n"
                            "    pub retries: u32,\n"
                            "}\n";
};

TEST_F(IntegrationTest, PatchesFileOnDisk)
{
    EXPECT_EQ(run_once(Config{}), 0);

    EXPECT_EQ(read(source_path_), expected_);
    EXPECT_THAT(stdout_, testing::HasSubstr("Patched " + source_path_ + ": 4 edits"));
    EXPECT_THAT(report_.str(), testing::HasSubstr("Documentation Patch Summary"));
    EXPECT_FALSE(fs::exists(source_path_ + ".tmp"));
}

TEST_F(IntegrationTest, SecondRunChangesNothing)
{
    ASSERT_EQ(run_once(Config{}), 0);
    ASSERT_EQ(read(source_path_), expected_);

    EXPECT_EQ(run_once(Config{}), 0);

    EXPECT_EQ(read(source_path_), expected_);
    EXPECT_THAT(stderr_, testing::HasSubstr("0 edits (skipped_no_sig=0, skipped_existing_doc=4, "
                                            "skipped_no_line=0, skipped_empty_doc=0, "
                                            "skipped_duplicate=0)"));
}

TEST_F(IntegrationTest, DryRunLeavesFileUntouched)
{
    EXPECT_EQ(run_once(Config{.dry_run = true}), 0);

    EXPECT_EQ(read(source_path_), source_);
    EXPECT_THAT(report_.str(), testing::HasSubstr("+ /// Returns one."));
    EXPECT_THAT(stdout_, testing::HasSubstr("Would patch"));
}

TEST_F(IntegrationTest, OnlyFilterRestrictsItems)
{
    EXPECT_EQ(run_once(Config{.only = {"alpha"}}), 0);

    auto patched = read(source_path_);
    EXPECT_THAT(patched, testing::HasSubstr("/// Returns one."));
    EXPECT_THAT(patched, testing::Not(testing::HasSubstr("/// Runtime settings.")));
}

TEST_F(IntegrationTest, MissingSourceFileFailsRun)
{
    fs::remove(source_path_);

    EXPECT_EQ(run_once(Config{}), 1);
    EXPECT_THAT(stderr_, testing::HasSubstr("Error processing " + source_path_));
}

TEST_F(IntegrationTest, FileSystemRoundTripsBytes)
{
    FileSystem filesystem;
    std::string content = "line one\r\nline two\n\xE2\x9C\x93";
    auto path = (dir_ / "bytes.txt").string();

    filesystem.write_file(path, content);

    EXPECT_FALSE(fs::exists(path + ".tmp"));
    EXPECT_EQ(filesystem.read_file(path), content);
    EXPECT_THROW(filesystem.read_file((dir_ / "absent.rs").string()), FileError);
}

} // namespace docpatch
