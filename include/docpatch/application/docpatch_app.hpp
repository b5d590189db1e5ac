#pragma once

#include "docpatch/core/doc_result.hpp"
#include "docpatch/interfaces.hpp"
#include "docpatch/ui/report.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace docpatch {

struct Config {
    std::string input_file = "-";    // stdin by default
    bool overwrite = false;          // Replace existing doc blocks
    bool dry_run = false;
    std::vector<std::string> only;   // fqpaths or item names; empty => all
};

class DocpatchApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IDocResultParser> parser_;
    std::unique_ptr<IReporter> reporter_;

public:
    DocpatchApp(std::unique_ptr<IFileSystem> filesystem,
                std::unique_ptr<IDocResultParser> parser,
                std::unique_ptr<IReporter> reporter);

    // 0 when every file was processed, 1 on any failure
    auto run(const Config& config) -> int;

private:
    auto load_results(const Config& config) -> std::vector<DocResult>;
    auto patch_file(const std::string& path, const std::vector<DocResult>& items,
                    const Config& config) -> FileOutcome;
    auto report_outcome(const FileOutcome& outcome, bool dry_run) -> void;
};

// Items whose fqpath or last path segment is listed; all items when `only` is empty
auto select_items(std::vector<DocResult> results, const std::vector<std::string>& only)
    -> std::vector<DocResult>;

// Items bucketed by file, files in path order
auto group_by_file(std::vector<DocResult> results)
    -> std::map<std::string, std::vector<DocResult>>;

} // namespace docpatch
