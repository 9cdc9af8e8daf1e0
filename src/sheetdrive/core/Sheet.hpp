#pragma once

#include "sheetdrive/core/Cell.hpp"
#include <string>
#include <map>
#include <functional>

namespace sheetdrive {
namespace core {

/**
 * @brief 工作表：稳定 id、可变显示名、引用到单元格的映射
 *
 * 单元格按引用字符串有序存放，保证序列化输出稳定。
 * 映射中不保存空单元格。列/行属性为不透明的字符串映射，原样持久化。
 */
class Sheet {
public:
    using CellMap = std::map<std::string, Cell>;
    using PropertyMap = std::map<std::string, std::string>;

    Sheet(std::string id, std::string name);

    const std::string& getId() const { return id_; }
    const std::string& getName() const { return name_; }
    void setName(std::string name) { name_ = std::move(name); }

    /**
     * @brief 查找单元格，不存在返回 nullptr
     */
    const Cell* findCell(const std::string& ref) const;

    /**
     * @brief 获取单元格，不存在时返回共享的空单元格
     */
    const Cell& getCell(const std::string& ref) const;

    /**
     * @brief 合并部分更新，合并结果为空时从映射中移除
     */
    void applyUpdate(const std::string& ref, const CellUpdate& update);

    /**
     * @brief 直接放入单元格（反序列化使用），空单元格会被忽略
     */
    void putCell(const std::string& ref, Cell cell);

    const CellMap& cells() const { return cells_; }
    size_t getCellCount() const { return cells_.size(); }

    /**
     * @brief 遍历所有公式单元格，回调可以修改缓存结果
     */
    void forEachFormulaCell(const std::function<void(const std::string& ref, Cell& cell)>& callback);

    PropertyMap& columns() { return columns_; }
    const PropertyMap& columns() const { return columns_; }
    PropertyMap& rows() { return rows_; }
    const PropertyMap& rows() const { return rows_; }

private:
    std::string id_;
    std::string name_;
    CellMap cells_;
    PropertyMap columns_;
    PropertyMap rows_;
};

}} // namespace sheetdrive::core
