#include "sheetdrive/persistence/FileRecordStore.hpp"
#include "sheetdrive/utils/FileWrapper.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"

namespace sheetdrive {
namespace persistence {

namespace {
constexpr const char* kTempSuffix = ".tmp";
}

FileRecordStore::FileRecordStore(const std::string& directory, const std::string& extension)
    : directory_(directory), extension_(extension) {
}

core::Path FileRecordStore::recordPath(const std::string& id) const {
    return directory_ / (id + extension_);
}

core::VoidResult FileRecordStore::validateId(const std::string& id) {
    // id 直接作为文件名，不能包含路径成分，也不能与隐藏的临时文件混淆
    if (id.empty() || id.front() == '.' ||
        id.find_first_of("/\\") != std::string::npos) {
        return core::Error(core::ErrorCode::InvalidArgument, "Invalid record id", id);
    }
    return {};
}

core::VoidResult FileRecordStore::writeRecord(const std::string& id, const std::string& content) {
    auto valid = validateId(id);
    if (!valid) {
        return valid;
    }

    if (!directory_.createDirectories()) {
        return core::Error(core::ErrorCode::FileWriteError,
                           "Cannot create data directory", directory_.string());
    }

    const core::Path target = recordPath(id);
    const core::Path temp = directory_ / ("." + id + extension_ + kTempSuffix);

    try {
        utils::FileWrapper file(temp.string(), "wb");
        file.writeAll(content);
        file.close();
    } catch (const core::FileException& e) {
        STORE_DEBUG("Writing record '{}' failed: {}", id, e.what());
        temp.remove();
        return core::Error(core::ErrorCode::FileWriteError, e.what(), target.string());
    }

    if (!temp.moveTo(target)) {
        temp.remove();
        return core::Error(core::ErrorCode::FileWriteError,
                           "Failed to move record into place", target.string());
    }

    STORE_DEBUG("Wrote record '{}' ({} bytes)", id, content.size());
    return {};
}

core::Result<std::string> FileRecordStore::readRecord(const std::string& id) const {
    auto valid = validateId(id);
    if (!valid) {
        return valid.error();
    }

    const core::Path path = recordPath(id);
    if (!path.isFile()) {
        return core::Error(core::ErrorCode::FileNotFound, "Record not found", id);
    }

    try {
        utils::FileWrapper file(path.string(), "rb");
        return file.readAll();
    } catch (const core::FileException& e) {
        return core::Error(core::ErrorCode::FileReadError, e.what(), path.string());
    }
}

std::vector<std::string> FileRecordStore::listRecordIds() const {
    std::vector<std::string> ids;
    if (!directory_.isDirectory()) {
        return ids;
    }

    for (const auto& file : directory_.listFiles()) {
        const std::string name = file.filename();
        if (name.empty() || name.front() == '.' || file.extension() != extension_) {
            continue;
        }
        ids.push_back(file.stem());
    }
    return ids;
}

core::VoidResult FileRecordStore::removeRecord(const std::string& id) {
    auto valid = validateId(id);
    if (!valid) {
        return valid;
    }

    const core::Path path = recordPath(id);
    if (!path.isFile()) {
        return core::Error(core::ErrorCode::FileNotFound, "Record not found", id);
    }
    if (!path.remove()) {
        return core::Error(core::ErrorCode::FileAccessDenied, "Failed to remove record", path.string());
    }
    return {};
}

}} // namespace sheetdrive::persistence
