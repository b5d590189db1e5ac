#include "docpatch/application/docpatch_app.hpp"
#include "docpatch/core/patch_planner.hpp"
#include "docpatch/errors.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>

namespace docpatch {

DocpatchApp::DocpatchApp(std::unique_ptr<IFileSystem> filesystem,
                         std::unique_ptr<IDocResultParser> parser,
                         std::unique_ptr<IReporter> reporter)
    : filesystem_(std::move(filesystem)), parser_(std::move(parser)),
      reporter_(std::move(reporter)) {}

auto DocpatchApp::run(const Config& config) -> int {
    std::vector<DocResult> results;
    try {
        results = load_results(config);
    } catch (const FileError& e) {
        std::cerr << "Error: cannot read results from " << e.path() << ": " << e.what() << '\n';
        return 1;
    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    results = select_items(std::move(results), config.only);
    if (results.empty()) {
        std::cout << "No documentation items to apply.\n";
        return 0;
    }

    auto files = group_by_file(std::move(results));
    std::cout << "Applying documentation to " << files.size() << " files"
              << (config.overwrite ? " (overwriting existing docs)" : "") << ".\n";

    std::vector<FileOutcome> outcomes;
    for (const auto& [path, items] : files) {
        auto outcome = patch_file(path, items, config);
        report_outcome(outcome, config.dry_run);
        outcomes.push_back(std::move(outcome));
    }

    reporter_->display_screen(compose_summary_screen(outcomes, config.dry_run));

    bool any_failed = std::any_of(outcomes.begin(), outcomes.end(),
                                  [](const FileOutcome& o) { return o.failed; });
    return any_failed ? 1 : 0;
}

auto DocpatchApp::load_results(const Config& config) -> std::vector<DocResult> {
    std::string input;

    if (config.input_file == "-") {
        // Read from stdin
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        input = oss.str();
    } else {
        input = filesystem_->read_file(config.input_file);
    }

    return parser_->parse_results(input);
}

auto DocpatchApp::patch_file(const std::string& path, const std::vector<DocResult>& items,
                             const Config& config) -> FileOutcome {
    FileOutcome outcome{.file = path};

    try {
        auto original = filesystem_->read_file(path);
        auto patch = plan_file_patch(original, items, config.overwrite);
        outcome.stats = patch.stats;

        if (patch.stats.edits == 0) {
            return outcome;
        }

        if (config.dry_run) {
            reporter_->display_screen(compose_preview_screen(path, original, patch));
            return outcome;
        }

        filesystem_->write_file(path, apply_edits(std::move(original), patch.edits()));
    } catch (const std::exception& e) {
        std::cerr << "Error processing " << path << ": " << e.what() << '\n';
        outcome.failed = true;
        outcome.error = e.what();
    }

    return outcome;
}

auto DocpatchApp::report_outcome(const FileOutcome& outcome, bool dry_run) -> void {
    if (outcome.failed) {
        return; // Already reported where it happened
    }

    const auto& stats = outcome.stats;
    if (stats.edits == 0) {
        std::cerr << "Patched " << outcome.file << ": 0 edits (skipped_no_sig="
                  << stats.skipped_no_anchor
                  << ", skipped_existing_doc=" << stats.skipped_existing_doc
                  << ", skipped_no_line=" << stats.skipped_no_line
                  << ", skipped_empty_doc=" << stats.skipped_empty_doc
                  << ", skipped_duplicate=" << stats.skipped_duplicate << ")\n";
        return;
    }

    std::cout << (dry_run ? "Would patch " : "Patched ") << outcome.file << ": " << stats.edits
              << " edits\n";
}

auto select_items(std::vector<DocResult> results, const std::vector<std::string>& only)
    -> std::vector<DocResult> {
    if (only.empty()) {
        return results;
    }

    std::erase_if(results, [&only](const DocResult& r) {
        auto listed = [&only](const std::string& name) {
            return std::find(only.begin(), only.end(), name) != only.end();
        };
        return !listed(r.fqpath) && !listed(item_name(r));
    });
    return results;
}

auto group_by_file(std::vector<DocResult> results)
    -> std::map<std::string, std::vector<DocResult>> {
    std::map<std::string, std::vector<DocResult>> files;
    for (auto& result : results) {
        files[result.file].push_back(std::move(result));
    }
    return files;
}

} // namespace docpatch
