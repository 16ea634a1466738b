#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

std::string FileUtils::joinPaths(const std::string& base, const std::string& leaf) {
    if (base.empty()) return leaf;
    if (leaf.empty()) return base;
    return (fs::path(base) / fs::path(leaf)).string();
}

bool FileUtils::ensureDirectoryExists(const std::string& path) {
    if (path.empty()) return false;
    std::error_code ec;
    if (fs::is_directory(path, ec)) return true;
    fs::create_directories(path, ec);
    if (ec) {
        nettrans::Logger::getInstance().error("FileUtils",
            "Failed to create directory " + path + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileUtils::fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}
