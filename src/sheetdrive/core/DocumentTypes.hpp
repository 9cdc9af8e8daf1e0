#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace sheetdrive {
namespace core {

/**
 * @brief 运行选项
 */
struct DriveOptions {
    std::string data_directory = "data";        // 记录存放目录
    char formula_prefix = '=';                   // 公式前缀
    std::string user_id = "1";                   // 记录所有者
    std::string default_document_name = "Untitled Spreadsheet";
    std::string record_extension = ".xml";       // 记录文件扩展名

    // 网格快照（命令行展示）
    int grid_rows = 20;
    int grid_cols = 10;
};

/**
 * @brief 文档元数据，id 在首次保存前为空
 */
struct DocumentMetadata {
    std::string id;
    std::string name;
    std::string created_at;   // ISO 8601
    std::string updated_at;   // ISO 8601
    std::string user_id;
};

struct SheetInfo {
    std::string id;
    std::string name;

    bool operator==(const SheetInfo& other) const {
        return id == other.id && name == other.name;
    }
};

/**
 * @brief 可加载的记录条目
 */
struct RecordInfo {
    std::string id;
    std::string name;

    bool operator==(const RecordInfo& other) const {
        return id == other.id && name == other.name;
    }
};

/**
 * @brief 工作表左上角区域的显示值快照（行优先）
 */
struct GridSnapshot {
    std::vector<std::string> column_headers;     // "A", "B", ...
    std::vector<std::vector<std::string>> rows;  // rows[r][c]，行号为 r + 1

    size_t rowCount() const { return rows.size(); }
    size_t colCount() const { return column_headers.size(); }
};

}} // namespace sheetdrive::core
