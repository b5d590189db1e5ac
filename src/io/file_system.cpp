#include "docpatch/io/file_system.hpp"
#include "docpatch/errors.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace docpatch {

auto FileSystem::read_file(const std::string& path) -> std::string {
    // Binary mode: line endings must round-trip untouched
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileError(path, "cannot open " + path + " for reading");
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw FileError(path, "failed while reading " + path);
    }
    return oss.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> void {
    write_atomic(path, content);
}

auto FileSystem::write_atomic(const std::string& path, const std::string& content) -> void {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw FileError(path, "cannot open " + temp_path + " for writing");
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();

        if (file.fail()) {
            file.close();
            std::error_code cleanup_ec;
            std::filesystem::remove(temp_path, cleanup_ec);
            throw FileError(path, "failed while writing " + temp_path);
        }
    } // File automatically closed here

    // Atomically replace original file
    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        throw FileError(path, "cannot replace " + path + ": " + ec.message());
    }
}

} // namespace docpatch
