#include "swissdesk/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace swissdesk::core::util {

namespace {

bool EnsureParentDir(const std::string& path) {
    const std::filesystem::path fs_path(path);
    if (fs_path.parent_path().empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
        std::cerr << "[atomic] Failed to create directory " << fs_path.parent_path().string()
                  << ": " << ec.message() << '\n';
        return false;
    }
    return true;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents) {
    if (!EnsureParentDir(path)) {
        return false;
    }
    const std::string temp_path = path + ".tmp";

    std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
    if (!output) {
        std::cerr << "[atomic] Failed to open temp file: " << temp_path << '\n';
        return false;
    }
    output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    output.flush();
    if (!output) {
        std::cerr << "[atomic] Failed to write temp file: " << temp_path << '\n';
        return false;
    }
    output.close();

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::cerr << "[atomic] rename failed for " << path << ": " << ec.message() << '\n';
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

}  // namespace swissdesk::core::util
