#pragma once

#include "sheetdrive/persistence/IRecordStore.hpp"
#include "sheetdrive/core/Path.hpp"

namespace sheetdrive {
namespace persistence {

/**
 * @brief 目录中的一记录一文件存储：<dir>/<id><extension>
 *
 * 写入先落到同目录的临时文件，再重命名到目标位置。
 * 目录在首次写入时创建。
 */
class FileRecordStore : public IRecordStore {
public:
    explicit FileRecordStore(const std::string& directory, const std::string& extension = ".xml");

    core::VoidResult writeRecord(const std::string& id, const std::string& content) override;
    core::Result<std::string> readRecord(const std::string& id) const override;
    std::vector<std::string> listRecordIds() const override;
    core::VoidResult removeRecord(const std::string& id) override;
    std::string getTypeName() const override { return "FileRecordStore"; }

    const core::Path& getDirectory() const { return directory_; }

    /**
     * @brief 记录文件路径
     */
    core::Path recordPath(const std::string& id) const;

private:
    static core::VoidResult validateId(const std::string& id);

    core::Path directory_;
    std::string extension_;
};

}} // namespace sheetdrive::persistence
