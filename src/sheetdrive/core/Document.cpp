#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/core/Exception.hpp"
#include "sheetdrive/formula/FormulaEvaluator.hpp"
#include "sheetdrive/utils/AddressParser.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <unordered_set>

namespace sheetdrive {
namespace core {

Document::Document() {
    sheets_.emplace_back("sheet1", "Sheet1");
    active_sheet_ = "sheet1";
}

Document::Document(std::vector<Sheet> sheets, const std::string& active_sheet, DocumentMetadata metadata)
    : sheets_(std::move(sheets)), metadata_(std::move(metadata)) {
    if (sheets_.empty()) {
        SHEETDRIVE_THROW(OperationException, "Document must contain at least one sheet",
                         "Document", ErrorCode::InvalidDocument);
    }

    std::unordered_set<std::string> ids;
    for (const auto& sheet : sheets_) {
        if (!ids.insert(sheet.getId()).second) {
            SHEETDRIVE_THROW(OperationException, "Duplicate sheet id: " + sheet.getId(),
                             "Document", ErrorCode::InvalidDocument);
        }
    }

    if (hasSheet(active_sheet)) {
        active_sheet_ = active_sheet;
    } else {
        CORE_WARN("Active sheet '{}' not found, falling back to '{}'", active_sheet, sheets_.front().getId());
        active_sheet_ = sheets_.front().getId();
    }
}

// ========== 单元格 ==========

const Cell& Document::getCell(const std::string& sheet_id, const std::string& ref) const {
    return requireSheet(sheet_id).getCell(ref);
}

void Document::setCell(const std::string& sheet_id, const std::string& ref, const CellUpdate& update) {
    Sheet& sheet = requireSheet(sheet_id);
    // 校验引用格式，失败抛 AddressParseException
    utils::AddressParser::parseReference(ref);

    sheet.applyUpdate(ref, update);
    dirty_ = true;

    if (update.touchesContent()) {
        formula::FormulaEvaluator evaluator(formula_prefix_);
        size_t count = evaluator.evaluateSheet(sheet);
        CORE_TRACE("Cell {}!{} updated, {} formulas re-evaluated", sheet_id, ref, count);
    }
}

std::string Document::displayValue(const std::string& sheet_id, const std::string& ref) const {
    return getCell(sheet_id, ref).displayValue();
}

std::string Document::editText(const std::string& sheet_id, const std::string& ref) const {
    return getCell(sheet_id, ref).editText();
}

// ========== 工作表 ==========

std::string Document::addSheet() {
    size_t n = sheets_.size() + 1;
    std::string id = "sheet" + std::to_string(n);
    // 删除中间工作表后序号可能与现有 id 冲突
    while (hasSheet(id)) {
        ++n;
        id = "sheet" + std::to_string(n);
    }

    sheets_.emplace_back(id, "Sheet" + std::to_string(n));
    active_sheet_ = id;
    dirty_ = true;

    CORE_DEBUG("Added sheet '{}'", id);
    return id;
}

void Document::removeSheet(const std::string& sheet_id) {
    auto it = std::find_if(sheets_.begin(), sheets_.end(),
                           [&](const Sheet& s) { return s.getId() == sheet_id; });
    if (it == sheets_.end()) {
        SHEETDRIVE_THROW(SheetNotFoundException, sheet_id);
    }
    if (sheets_.size() <= 1) {
        CORE_DEBUG("Refusing to remove the last sheet '{}'", sheet_id);
        return;
    }

    sheets_.erase(it);
    if (active_sheet_ == sheet_id) {
        active_sheet_ = sheets_.front().getId();
    }
    dirty_ = true;

    CORE_DEBUG("Removed sheet '{}', active sheet is '{}'", sheet_id, active_sheet_);
}

void Document::renameSheet(const std::string& sheet_id, const std::string& name) {
    requireSheet(sheet_id).setName(name);
    dirty_ = true;
}

Error Document::setActiveSheet(const std::string& sheet_id) {
    if (!hasSheet(sheet_id)) {
        return Error(ErrorCode::SheetNotFound, "Sheet not found", sheet_id);
    }
    active_sheet_ = sheet_id;
    return success();
}

std::vector<SheetInfo> Document::listSheets() const {
    std::vector<SheetInfo> result;
    result.reserve(sheets_.size());
    for (const auto& sheet : sheets_) {
        result.push_back(SheetInfo{sheet.getId(), sheet.getName()});
    }
    return result;
}

bool Document::hasSheet(const std::string& sheet_id) const {
    return findSheet(sheet_id) != nullptr;
}

const Sheet& Document::getSheet(const std::string& sheet_id) const {
    return requireSheet(sheet_id);
}

GridSnapshot Document::snapshotGrid(const std::string& sheet_id, int rows, int cols) const {
    const Sheet& sheet = requireSheet(sheet_id);

    GridSnapshot snapshot;
    rows = std::max(rows, 0);
    cols = std::max(cols, 0);

    for (int c = 0; c < cols; ++c) {
        snapshot.column_headers.push_back(utils::AddressParser::encodeColumn(c));
    }
    snapshot.rows.reserve(static_cast<size_t>(rows));
    for (int r = 0; r < rows; ++r) {
        std::vector<std::string> line;
        line.reserve(static_cast<size_t>(cols));
        for (int c = 0; c < cols; ++c) {
            line.push_back(sheet.getCell(utils::AddressParser::toReference(r, c)).displayValue());
        }
        snapshot.rows.push_back(std::move(line));
    }
    return snapshot;
}

// ========== 计算 ==========

void Document::recalculate(const std::string& sheet_id) {
    formula::FormulaEvaluator evaluator(formula_prefix_);
    evaluator.evaluateSheet(requireSheet(sheet_id));
}

void Document::recalculateAll() {
    formula::FormulaEvaluator evaluator(formula_prefix_);
    size_t count = 0;
    for (auto& sheet : sheets_) {
        count += evaluator.evaluateSheet(sheet);
    }
    CORE_DEBUG("Recalculated {} formulas across {} sheets", count, sheets_.size());
}

// ========== 内部 ==========

Sheet* Document::findSheet(const std::string& sheet_id) {
    for (auto& sheet : sheets_) {
        if (sheet.getId() == sheet_id) return &sheet;
    }
    return nullptr;
}

const Sheet* Document::findSheet(const std::string& sheet_id) const {
    for (const auto& sheet : sheets_) {
        if (sheet.getId() == sheet_id) return &sheet;
    }
    return nullptr;
}

Sheet& Document::requireSheet(const std::string& sheet_id) {
    Sheet* sheet = findSheet(sheet_id);
    if (!sheet) {
        SHEETDRIVE_THROW(SheetNotFoundException, sheet_id);
    }
    return *sheet;
}

const Sheet& Document::requireSheet(const std::string& sheet_id) const {
    const Sheet* sheet = findSheet(sheet_id);
    if (!sheet) {
        SHEETDRIVE_THROW(SheetNotFoundException, sheet_id);
    }
    return *sheet;
}

}} // namespace sheetdrive::core
