#pragma once

#include "sheetdrive/core/Expected.hpp"
#include <string>
#include <vector>

namespace sheetdrive {
namespace persistence {

/**
 * @brief 持久记录存储接口 - 策略模式
 *
 * 以不透明 id 为键保存完整的记录文本。实现必须保证 writeRecord 的原子性：
 * 写入失败时不能留下可被 readRecord / listRecordIds 看到的半截记录。
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /**
     * @brief 写入（覆盖）一条记录
     * @return 失败返回 FileWriteError
     */
    virtual core::VoidResult writeRecord(const std::string& id, const std::string& content) = 0;

    /**
     * @brief 读取一条记录
     * @return 不存在返回 FileNotFound，读取失败返回 FileReadError
     */
    virtual core::Result<std::string> readRecord(const std::string& id) const = 0;

    /**
     * @brief 列出全部记录 id，按 id 排序
     */
    virtual std::vector<std::string> listRecordIds() const = 0;

    /**
     * @brief 删除一条记录
     * @return 不存在返回 FileNotFound
     */
    virtual core::VoidResult removeRecord(const std::string& id) = 0;

    /**
     * @brief 获取存储类型名称（用于调试）
     */
    virtual std::string getTypeName() const = 0;
};

}} // namespace sheetdrive::persistence
