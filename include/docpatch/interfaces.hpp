#pragma once

#include <string>
#include <vector>

namespace docpatch {

// Forward declarations
struct DocResult;
struct Screen;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    // Both throw FileError on failure
    virtual auto read_file(const std::string& path) -> std::string = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> void = 0;
};

class IDocResultParser {
public:
    virtual ~IDocResultParser() = default;
    virtual auto parse_results(const std::string& json_text) -> std::vector<DocResult> = 0;
};

class IReporter {
public:
    virtual ~IReporter() = default;
    virtual auto display_screen(const Screen& screen) -> void = 0;
};

} // namespace docpatch
