#pragma once

#include "sheetdrive/persistence/IRecordStore.hpp"
#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/core/DocumentTypes.hpp"
#include "sheetdrive/core/Expected.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sheetdrive {
namespace persistence {

/**
 * @brief 文档仓库：在记录存储之上实现保存、加载与列举
 *
 * - save：首次保存分配随机 UUID，之后复用；更新 updatedAt，保留 createdAt；
 *         写入失败时文档（id、时间戳、名称、脏标记）保持不变
 * - load：缓存结果一律重算，不信任存储内容
 * - listAvailable：无法解析的记录跳过并记录警告
 */
class DocumentRepository {
public:
    /**
     * @throws ParameterException store 为空
     */
    explicit DocumentRepository(std::unique_ptr<IRecordStore> store,
                                core::DriveOptions options = core::DriveOptions());

    /**
     * @brief 保存文档
     * @param display_name 为空时沿用文档当前名称，新文档使用 default_document_name
     * @return 记录 id；没有可用名称返回 InvalidArgument，写入失败返回 FileWriteError
     */
    core::Result<std::string> save(core::Document& document, const std::string& display_name);

    /**
     * @brief 加载文档，重算所有公式并清除脏标记
     * @return 不存在返回 FileNotFound，损坏返回 FileCorrupted
     */
    core::Result<core::Document> load(const std::string& id) const;

    /**
     * @brief 列举可加载的记录
     */
    std::vector<core::RecordInfo> listAvailable() const;

    core::VoidResult remove(const std::string& id);

    IRecordStore& getStore() { return *store_; }
    const core::DriveOptions& getOptions() const { return options_; }

private:
    std::unique_ptr<IRecordStore> store_;
    core::DriveOptions options_;
};

}} // namespace sheetdrive::persistence
