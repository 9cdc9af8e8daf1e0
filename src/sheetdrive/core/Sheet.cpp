#include "sheetdrive/core/Sheet.hpp"

namespace sheetdrive {
namespace core {

namespace {
const Cell kEmptyCell;
}

Sheet::Sheet(std::string id, std::string name)
    : id_(std::move(id)), name_(std::move(name)) {
}

const Cell* Sheet::findCell(const std::string& ref) const {
    auto it = cells_.find(ref);
    return it != cells_.end() ? &it->second : nullptr;
}

const Cell& Sheet::getCell(const std::string& ref) const {
    const Cell* cell = findCell(ref);
    return cell ? *cell : kEmptyCell;
}

void Sheet::applyUpdate(const std::string& ref, const CellUpdate& update) {
    auto it = cells_.find(ref);
    if (it == cells_.end()) {
        Cell cell;
        cell.apply(update);
        if (!cell.isEmpty()) {
            cells_.emplace(ref, std::move(cell));
        }
        return;
    }

    it->second.apply(update);
    if (it->second.isEmpty()) {
        cells_.erase(it);
    }
}

void Sheet::putCell(const std::string& ref, Cell cell) {
    if (cell.isEmpty()) {
        cells_.erase(ref);
        return;
    }
    cells_[ref] = std::move(cell);
}

void Sheet::forEachFormulaCell(const std::function<void(const std::string& ref, Cell& cell)>& callback) {
    for (auto& [ref, cell] : cells_) {
        if (cell.isFormula()) {
            callback(ref, cell);
        }
    }
}

}} // namespace sheetdrive::core
