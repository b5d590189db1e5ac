#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace docpatch {

// I/O failure on a specific file
class FileError : public std::runtime_error {
private:
    std::string path_;

public:
    FileError(std::string path, const std::string& cause)
        : std::runtime_error(cause), path_(std::move(path)) {}

    auto path() const -> const std::string& { return path_; }
};

// Results document that cannot be understood at all
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace docpatch
