#include "docpatch/application/docpatch_app.hpp"
#include "docpatch/io/file_system.hpp"
#include "docpatch/parsers/doc_result_parser.hpp"
#include "docpatch/ui/ftxui_reporter.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

namespace {

auto split_names(const std::string& list) -> std::vector<std::string> {
    std::vector<std::string> names;
    std::istringstream iss(list);
    std::string name;
    while (std::getline(iss, name, ',')) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

auto parse_args(int argc, char* argv[]) -> docpatch::Config {
    docpatch::Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
            config.input_file = argv[++i];
        } else if (arg == "--overwrite") {
            config.overwrite = true;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--only" && i + 1 < argc) {
            auto names = split_names(argv[++i]);
            config.only.insert(config.only.end(), names.begin(), names.end());
        } else if (arg == "-h" || arg == "--help") {
            std::cout << "Usage: docpatch [options]\n";
            std::cout << "  -i, --input <file>   Read documentation results from file (default: stdin)\n";
            std::cout << "      --overwrite      Replace existing doc blocks\n";
            std::cout << "      --dry-run        Preview edits without modifying files\n";
            std::cout << "      --only <names>   Comma separated fqpaths or item names to apply\n";
            std::cout << "  -h, --help           Show this help\n";
            std::cout << "\nExamples:\n";
            std::cout << "  docpatch -i docs.json                  # Insert missing docs\n";
            std::cout << "  docpatch -i docs.json --overwrite      # Also replace existing docs\n";
            std::cout << "  docpatch -i docs.json --dry-run        # Preview only\n";
            std::cout << "  cat docs.json | docpatch --only parse  # Piped input, one item\n";
            std::exit(0);
        } else {
            std::cerr << "Warning: ignoring unknown argument " << arg << "\n";
        }
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace docpatch;

    auto config = parse_args(argc, argv);

    // The parser reads struct sources for field docs; both share one file system
    auto filesystem = std::make_unique<FileSystem>();
    auto parser = std::make_unique<DocResultParser>(*filesystem);
    auto reporter = std::make_unique<FtxuiReporter>(std::cout);

    DocpatchApp app(std::move(filesystem), std::move(parser), std::move(reporter));
    return app.run(config);
}
