#pragma once

#include "sheetdrive/core/Sheet.hpp"
#include "sheetdrive/core/DocumentTypes.hpp"
#include "sheetdrive/core/ErrorCode.hpp"
#include <string>
#include <vector>

namespace sheetdrive {
namespace core {

/**
 * @brief 文档：有序工作表序列 + 活动工作表 + 元数据 + 脏标记
 *
 * 不变量：
 * - 至少包含一个工作表
 * - 活动工作表总是指向存在的工作表
 * - 内容修改（单元格、工作表增删改名）置脏；切换活动工作表不置脏
 *
 * 每次触及单元格内容的修改都会重算该工作表的全部公式。
 *
 * @example
 * Document doc;
 * doc.setCell("sheet1", "A1", CellUpdate::literal("5"));
 * doc.setCell("sheet1", "A2", CellUpdate::makeFormula("=SUM(A1:A1)"));
 * doc.displayValue("sheet1", "A2");  // "5"
 */
class Document {
public:
    /**
     * @brief 新文档：一个默认工作表 sheet1/Sheet1，未保存且不脏
     */
    Document();

    /**
     * @brief 从已有工作表构造（反序列化使用），不重算、不置脏
     * @param active_sheet 不存在时回退为第一个工作表
     * @throws OperationException 工作表为空或 id 重复
     */
    Document(std::vector<Sheet> sheets, const std::string& active_sheet, DocumentMetadata metadata);

    // ========== 单元格 ==========

    /**
     * @brief 获取单元格，不存在时返回空单元格
     * @throws SheetNotFoundException
     */
    const Cell& getCell(const std::string& sheet_id, const std::string& ref) const;

    /**
     * @brief 合并更新单元格并置脏；触及内容时重算整张表
     * @throws SheetNotFoundException 工作表不存在
     * @throws AddressParseException 引用格式错误
     */
    void setCell(const std::string& sheet_id, const std::string& ref, const CellUpdate& update);

    /**
     * @throws SheetNotFoundException
     */
    std::string displayValue(const std::string& sheet_id, const std::string& ref) const;

    /**
     * @throws SheetNotFoundException
     */
    std::string editText(const std::string& sheet_id, const std::string& ref) const;

    // ========== 工作表 ==========

    /**
     * @brief 追加 sheet{n+1}/Sheet{n+1} 并激活
     * @return 新工作表 id
     */
    std::string addSheet();

    /**
     * @brief 删除工作表；只剩一个时什么也不做
     * @throws SheetNotFoundException
     */
    void removeSheet(const std::string& sheet_id);

    /**
     * @throws SheetNotFoundException
     */
    void renameSheet(const std::string& sheet_id, const std::string& name);

    /**
     * @brief 切换活动工作表，不置脏
     * @return 未知 id 返回 SheetNotFound 错误，状态不变
     */
    Error setActiveSheet(const std::string& sheet_id);

    std::vector<SheetInfo> listSheets() const;
    const std::string& getActiveSheetId() const { return active_sheet_; }
    bool hasSheet(const std::string& sheet_id) const;
    size_t getSheetCount() const { return sheets_.size(); }

    /**
     * @throws SheetNotFoundException
     */
    const Sheet& getSheet(const std::string& sheet_id) const;
    const std::vector<Sheet>& sheets() const { return sheets_; }

    /**
     * @brief 左上角 rows × cols 区域的显示值
     * @throws SheetNotFoundException
     */
    GridSnapshot snapshotGrid(const std::string& sheet_id, int rows, int cols) const;

    // ========== 计算 ==========

    void recalculate(const std::string& sheet_id);
    void recalculateAll();

    void setFormulaPrefix(char prefix) { formula_prefix_ = prefix; }
    char getFormulaPrefix() const { return formula_prefix_; }

    // ========== 状态 ==========

    bool isDirty() const { return dirty_; }
    void markDirty() { dirty_ = true; }
    void markClean() { dirty_ = false; }

    const DocumentMetadata& getMetadata() const { return metadata_; }
    void setMetadata(DocumentMetadata metadata) { metadata_ = std::move(metadata); }

private:
    Sheet* findSheet(const std::string& sheet_id);
    const Sheet* findSheet(const std::string& sheet_id) const;
    Sheet& requireSheet(const std::string& sheet_id);
    const Sheet& requireSheet(const std::string& sheet_id) const;

    std::vector<Sheet> sheets_;
    std::string active_sheet_;
    DocumentMetadata metadata_;
    char formula_prefix_ = '=';
    bool dirty_ = false;
};

}} // namespace sheetdrive::core
