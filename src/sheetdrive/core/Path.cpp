#include "sheetdrive/core/Path.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace sheetdrive {
namespace core {

Path::Path(const std::string& path) : utf8_path_(path) {}

Path::Path(const char* path) : Path(std::string(path)) {}

Path Path::operator/(const std::string& child) const {
    return Path((fs::path(utf8_path_) / child).string());
}

std::string Path::filename() const {
    return fs::path(utf8_path_).filename().string();
}

std::string Path::stem() const {
    return fs::path(utf8_path_).stem().string();
}

std::string Path::extension() const {
    return fs::path(utf8_path_).extension().string();
}

bool Path::exists() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::exists(utf8_path_, ec);
}

bool Path::isFile() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_regular_file(utf8_path_, ec);
}

bool Path::isDirectory() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    return fs::is_directory(utf8_path_, ec);
}

bool Path::remove() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    bool removed = fs::remove(utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error removing file '{}': {}", utf8_path_, ec.message());
        return false;
    }
    return removed;
}

bool Path::moveTo(const Path& target) const {
    if (utf8_path_.empty() || target.utf8_path_.empty()) return false;
    std::error_code ec;
    fs::rename(utf8_path_, target.utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error moving '{}' to '{}': {}", utf8_path_, target.utf8_path_, ec.message());
        return false;
    }
    return true;
}

bool Path::createDirectories() const {
    if (utf8_path_.empty()) return false;
    std::error_code ec;
    fs::create_directories(utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Filesystem error creating directory '{}': {}", utf8_path_, ec.message());
    }
    return isDirectory();
}

std::vector<Path> Path::listFiles() const {
    std::vector<Path> result;
    std::error_code ec;
    fs::directory_iterator it(utf8_path_, ec);
    if (ec) {
        UTILS_DEBUG("Cannot list directory '{}': {}", utf8_path_, ec.message());
        return result;
    }
    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            UTILS_DEBUG("Directory iteration stopped in '{}': {}", utf8_path_, ec.message());
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            result.emplace_back(it->path().string());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

FILE* Path::openForRead(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "rb" : "r");
}

FILE* Path::openForWrite(bool binary) const {
    if (utf8_path_.empty()) return nullptr;
    return std::fopen(utf8_path_.c_str(), binary ? "wb" : "w");
}

}} // namespace sheetdrive::core
