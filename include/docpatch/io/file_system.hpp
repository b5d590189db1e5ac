#pragma once

#include "docpatch/interfaces.hpp"
#include <string>

namespace docpatch {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::string override;
    auto write_file(const std::string& path, const std::string& content) -> void override;

private:
    auto write_atomic(const std::string& path, const std::string& content) -> void;
};

} // namespace docpatch
