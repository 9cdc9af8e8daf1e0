#include "sheetdrive/core/Cell.hpp"

namespace sheetdrive {
namespace core {

namespace {
const std::string kEmptyString;
const std::optional<EvaluationResult> kNoCachedValue;
}

// ========== CellUpdate ==========

CellUpdate CellUpdate::literal(std::string text) {
    CellUpdate update;
    update.value = FieldUpdate<std::string>::set(std::move(text));
    update.formula = FieldUpdate<std::string>::clear();
    update.cached_value = FieldUpdate<EvaluationResult>::clear();
    return update;
}

CellUpdate CellUpdate::makeFormula(std::string text) {
    CellUpdate update;
    update.formula = FieldUpdate<std::string>::set(std::move(text));
    update.value = FieldUpdate<std::string>::clear();
    update.cached_value = FieldUpdate<EvaluationResult>::clear();
    return update;
}

CellUpdate CellUpdate::fromInput(std::string text, char formula_prefix) {
    if (!text.empty() && text.front() == formula_prefix) {
        return makeFormula(std::move(text));
    }
    return literal(std::move(text));
}

CellUpdate CellUpdate::clearAll() {
    CellUpdate update;
    update.value = FieldUpdate<std::string>::clear();
    update.formula = FieldUpdate<std::string>::clear();
    update.cached_value = FieldUpdate<EvaluationResult>::clear();
    return update;
}

// ========== Cell ==========

Cell Cell::literal(std::string text) {
    Cell cell;
    if (!text.empty()) {
        cell.data_ = LiteralData{std::move(text)};
    }
    return cell;
}

Cell Cell::formula(std::string text, std::optional<EvaluationResult> cached) {
    Cell cell;
    if (!text.empty()) {
        cell.data_ = FormulaData{std::move(text), std::move(cached)};
    }
    return cell;
}

CellType Cell::getType() const noexcept {
    switch (data_.index()) {
        case 1: return CellType::Literal;
        case 2: return CellType::Formula;
        default: return CellType::Empty;
    }
}

const std::string& Cell::getValue() const noexcept {
    if (const auto* lit = std::get_if<LiteralData>(&data_)) {
        return lit->text;
    }
    return kEmptyString;
}

const std::string& Cell::getFormula() const noexcept {
    if (const auto* f = std::get_if<FormulaData>(&data_)) {
        return f->text;
    }
    return kEmptyString;
}

const std::optional<EvaluationResult>& Cell::getCachedValue() const noexcept {
    if (const auto* f = std::get_if<FormulaData>(&data_)) {
        return f->cached;
    }
    return kNoCachedValue;
}

void Cell::setCachedValue(std::optional<EvaluationResult> cached) {
    if (auto* f = std::get_if<FormulaData>(&data_)) {
        f->cached = std::move(cached);
    }
}

std::string Cell::displayValue() const {
    if (const auto* f = std::get_if<FormulaData>(&data_)) {
        return f->cached ? f->cached->toString() : f->text;
    }
    return getValue();
}

std::string Cell::editText() const {
    if (isFormula()) {
        return getFormula();
    }
    return getValue();
}

void Cell::apply(const CellUpdate& update) {
    // 先展开成三个独立字段，合并后再收敛回变体
    std::string value = getValue();
    std::string formula_text = getFormula();
    std::optional<EvaluationResult> cached = getCachedValue();

    if (update.value.isSet()) {
        value = update.value.value();
    } else if (update.value.isClear()) {
        value.clear();
    }

    if (update.formula.isSet()) {
        formula_text = update.formula.value();
        // 公式变化后旧的缓存结果失效
        cached.reset();
    } else if (update.formula.isClear()) {
        formula_text.clear();
        cached.reset();
    }

    if (update.cached_value.isSet()) {
        cached = update.cached_value.value();
    } else if (update.cached_value.isClear()) {
        cached.reset();
    }

    // 只设置了一侧时清除另一侧
    if (update.value.isSet() && !update.formula.isSet()) {
        formula_text.clear();
    }

    if (!formula_text.empty()) {
        data_ = FormulaData{std::move(formula_text), std::move(cached)};
    } else if (!value.empty()) {
        data_ = LiteralData{std::move(value)};
    } else {
        data_ = std::monostate{};
    }
}

bool Cell::operator==(const Cell& other) const {
    if (getType() != other.getType()) {
        return false;
    }
    switch (getType()) {
        case CellType::Literal:
            return getValue() == other.getValue();
        case CellType::Formula:
            return getFormula() == other.getFormula() && getCachedValue() == other.getCachedValue();
        default:
            return true;
    }
}

}} // namespace sheetdrive::core
