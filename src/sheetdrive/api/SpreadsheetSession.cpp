#include "sheetdrive/api/SpreadsheetSession.hpp"
#include "sheetdrive/persistence/FileRecordStore.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"

namespace sheetdrive {

SpreadsheetSession::SpreadsheetSession(core::DriveOptions options)
    : SpreadsheetSession(options,
                         std::make_unique<persistence::FileRecordStore>(options.data_directory,
                                                                        options.record_extension)) {
}

SpreadsheetSession::SpreadsheetSession(core::DriveOptions options,
                                       std::unique_ptr<persistence::IRecordStore> store)
    : options_(std::move(options))
    , repository_(std::move(store), options_) {
    document_.setFormulaPrefix(options_.formula_prefix);
}

// ========== 读取 ==========

std::string SpreadsheetSession::displayValue(const std::string& sheet_id, const std::string& ref) const {
    return document_.displayValue(sheet_id, ref);
}

std::string SpreadsheetSession::editText(const std::string& sheet_id, const std::string& ref) const {
    return document_.editText(sheet_id, ref);
}

std::vector<core::SheetInfo> SpreadsheetSession::listSheets() const {
    return document_.listSheets();
}

const std::string& SpreadsheetSession::activeSheetId() const {
    return document_.getActiveSheetId();
}

bool SpreadsheetSession::isDirty() const {
    return document_.isDirty();
}

std::vector<core::RecordInfo> SpreadsheetSession::listAvailable() const {
    return repository_.listAvailable();
}

const core::DocumentMetadata& SpreadsheetSession::currentRecord() const {
    return document_.getMetadata();
}

std::string SpreadsheetSession::statusText() const {
    return document_.isDirty() ? "Ready (Modified)" : "Ready";
}

core::GridSnapshot SpreadsheetSession::snapshotGrid(const std::string& sheet_id) const {
    return document_.snapshotGrid(sheet_id, options_.grid_rows, options_.grid_cols);
}

core::GridSnapshot SpreadsheetSession::snapshotGrid(const std::string& sheet_id, int rows, int cols) const {
    return document_.snapshotGrid(sheet_id, rows, cols);
}

// ========== 写入 ==========

void SpreadsheetSession::setCell(const std::string& sheet_id, const std::string& ref,
                                 const core::CellUpdate& update) {
    document_.setCell(sheet_id, ref, update);
}

void SpreadsheetSession::commitInput(const std::string& sheet_id, const std::string& ref,
                                     const std::string& text) {
    document_.setCell(sheet_id, ref, core::CellUpdate::fromInput(text, options_.formula_prefix));
}

std::string SpreadsheetSession::addSheet() {
    return document_.addSheet();
}

void SpreadsheetSession::removeSheet(const std::string& sheet_id) {
    document_.removeSheet(sheet_id);
}

void SpreadsheetSession::renameSheet(const std::string& sheet_id, const std::string& name) {
    document_.renameSheet(sheet_id, name);
}

core::Error SpreadsheetSession::setActiveSheet(const std::string& sheet_id) {
    return document_.setActiveSheet(sheet_id);
}

core::Result<std::string> SpreadsheetSession::save(const std::string& name) {
    return repository_.save(document_, name);
}

core::VoidResult SpreadsheetSession::load(const std::string& id) {
    auto loaded = repository_.load(id);
    if (!loaded) {
        return loaded.error();
    }
    document_ = std::move(loaded).value();
    return {};
}

void SpreadsheetSession::newDocument() {
    document_ = core::Document();
    document_.setFormulaPrefix(options_.formula_prefix);
    CORE_DEBUG("Started a new document");
}

} // namespace sheetdrive
