#pragma once

#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/core/DocumentTypes.hpp"
#include "sheetdrive/core/Expected.hpp"
#include "sheetdrive/persistence/DocumentRepository.hpp"
#include <memory>
#include <string>
#include <vector>

namespace sheetdrive {

/**
 * @brief 面向界面层的会话：持有一个文档与一个文档仓库
 *
 * 读取：displayValue / editText / listSheets / activeSheetId / isDirty /
 *       listAvailable / currentRecord / statusText / snapshotGrid
 * 写入：setCell / commitInput / addSheet / removeSheet / renameSheet /
 *       setActiveSheet / save / load / newDocument
 *
 * 保存、加载失败返回 Error，会话中的文档保持原状。
 *
 * @example
 * SpreadsheetSession session;  // 记录存放在 ./data
 * session.commitInput("sheet1", "A1", "5");
 * session.commitInput("sheet1", "A2", "=SUM(A1:A1)");
 * auto id = session.save("Budget");
 */
class SpreadsheetSession {
public:
    /**
     * @brief 使用 options.data_directory 下的文件存储
     */
    explicit SpreadsheetSession(core::DriveOptions options = core::DriveOptions());

    /**
     * @brief 使用指定的记录存储
     */
    SpreadsheetSession(core::DriveOptions options, std::unique_ptr<persistence::IRecordStore> store);

    // ========== 读取 ==========

    std::string displayValue(const std::string& sheet_id, const std::string& ref) const;
    std::string editText(const std::string& sheet_id, const std::string& ref) const;
    std::vector<core::SheetInfo> listSheets() const;
    const std::string& activeSheetId() const;
    bool isDirty() const;
    std::vector<core::RecordInfo> listAvailable() const;

    /**
     * @brief 当前文档的元数据（未保存的新文档 id 为空）
     */
    const core::DocumentMetadata& currentRecord() const;

    /**
     * @brief "Ready" 或 "Ready (Modified)"
     */
    std::string statusText() const;

    /**
     * @brief 按配置的行列数取网格快照
     */
    core::GridSnapshot snapshotGrid(const std::string& sheet_id) const;
    core::GridSnapshot snapshotGrid(const std::string& sheet_id, int rows, int cols) const;

    // ========== 写入 ==========

    void setCell(const std::string& sheet_id, const std::string& ref, const core::CellUpdate& update);

    /**
     * @brief 提交用户输入：以公式前缀开头为公式，否则为字面值
     */
    void commitInput(const std::string& sheet_id, const std::string& ref, const std::string& text);

    std::string addSheet();
    void removeSheet(const std::string& sheet_id);
    void renameSheet(const std::string& sheet_id, const std::string& name);
    core::Error setActiveSheet(const std::string& sheet_id);

    core::Result<std::string> save(const std::string& name);
    core::VoidResult load(const std::string& id);

    /**
     * @brief 丢弃当前文档，换成只有一个工作表的新文档
     */
    void newDocument();

    const core::Document& document() const { return document_; }
    const core::DriveOptions& options() const { return options_; }

private:
    core::DriveOptions options_;
    persistence::DocumentRepository repository_;
    core::Document document_;
};

} // namespace sheetdrive
