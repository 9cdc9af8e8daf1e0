#include "sheetdrive/formula/FormulaEvaluator.hpp"
#include "sheetdrive/utils/AddressParser.hpp"
#include "sheetdrive/utils/CommonUtils.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"

namespace sheetdrive {
namespace formula {

using utils::CommonUtils;

namespace {

constexpr std::string_view kSum = "SUM(";
constexpr std::string_view kAverage = "AVERAGE(";

// 取 "NAME(...)" 的括号内文本；不匹配返回 false
bool extractArguments(std::string_view body, std::string_view keyword, std::string_view& args) {
    if (!CommonUtils::startsWith(body, keyword) || body.size() <= keyword.size() || body.back() != ')') {
        return false;
    }
    args = body.substr(keyword.size(), body.size() - keyword.size() - 1);
    return true;
}

} // namespace

FormulaEvaluator::FormulaEvaluator(char formula_prefix)
    : formula_prefix_(formula_prefix) {
}

std::string_view FormulaEvaluator::stripFormula(std::string_view formula_text) const {
    if (!formula_text.empty() && formula_text.front() == formula_prefix_) {
        formula_text.remove_prefix(1);
    }
    return CommonUtils::trim(formula_text);
}

core::EvaluationResult FormulaEvaluator::evaluate(std::string_view formula_text, const core::Sheet& sheet) const {
    const std::string_view body = stripFormula(formula_text);
    std::string_view args;

    if (extractArguments(body, kSum, args)) {
        if (args.find(':') != std::string_view::npos) {
            core::CellRange range(core::Address(0, 0));
            if (tryParseRange(args, range)) {
                return core::EvaluationResult::number(aggregate(AggregateFunction::Sum, range, sheet).value);
            }
        } else {
            std::vector<std::string> references;
            for (std::string_view item : CommonUtils::split(args, ',')) {
                references.emplace_back(CommonUtils::trim(item));
            }
            return core::EvaluationResult::number(aggregate(AggregateFunction::Sum, references, sheet).value);
        }
    }

    if (extractArguments(body, kAverage, args) && args.find(':') != std::string_view::npos) {
        core::CellRange range(core::Address(0, 0));
        if (tryParseRange(args, range)) {
            return core::EvaluationResult::number(aggregate(AggregateFunction::Average, range, sheet).value);
        }
    }

    FORMULA_DEBUG("Formula '{}' not recognized, falling back to text", body);
    return core::EvaluationResult::text(std::string(body));
}

size_t FormulaEvaluator::evaluateSheet(core::Sheet& sheet) const {
    size_t evaluated = 0;
    // 公式单元格不参与聚合，所以求值顺序不影响结果
    sheet.forEachFormulaCell([&](const std::string& /*ref*/, core::Cell& cell) {
        cell.setCachedValue(evaluate(cell.getFormula(), sheet));
        ++evaluated;
    });
    FORMULA_TRACE("Evaluated {} formulas on sheet '{}'", evaluated, sheet.getId());
    return evaluated;
}

bool FormulaEvaluator::tryParseRange(std::string_view args, core::CellRange& out) {
    auto parts = CommonUtils::split(args, ':');
    if (parts.size() != 2) {
        return false;
    }

    auto first = utils::AddressParser::tryParseReference(CommonUtils::trim(parts[0]));
    auto second = utils::AddressParser::tryParseReference(CommonUtils::trim(parts[1]));
    if (!first || !second) {
        return false;
    }

    out = core::CellRange(core::Address(first->first, first->second),
                          core::Address(second->first, second->second));
    return true;
}

void FormulaEvaluator::accumulate(const core::Cell* cell, double& sum, AggregateResult& result) {
    // 只有非空字面值参与；公式单元格没有 value 字段
    if (!cell || !cell->isLiteral()) {
        return;
    }

    auto number = CommonUtils::parseDouble(cell->getValue());
    if (!number) {
        FORMULA_DEBUG("Skipping non-numeric value '{}'", cell->getValue());
        ++result.skipped;
        return;
    }
    sum += *number;
    ++result.counted;
}

void FormulaEvaluator::finish(AggregateFunction function, double sum, AggregateResult& result) {
    if (function == AggregateFunction::Average) {
        // 没有数值时返回 0，而不是除以零
        result.value = result.counted > 0 ? sum / static_cast<double>(result.counted) : 0.0;
    } else {
        result.value = sum;
    }
}

AggregateResult FormulaEvaluator::aggregate(AggregateFunction function,
                                            const core::CellRange& range,
                                            const core::Sheet& sheet) {
    AggregateResult result;
    double sum = 0.0;

    // 范围远大于已存单元格数时改为遍历已存单元格，结果集合相同
    if (range.getCellCount() > static_cast<long long>(sheet.getCellCount())) {
        for (const auto& [ref, cell] : sheet.cells()) {
            auto position = utils::AddressParser::tryParseReference(ref);
            if (position && range.contains(core::Address(position->first, position->second))) {
                accumulate(&cell, sum, result);
            }
        }
    } else {
        range.forEach([&](int row, int col) {
            accumulate(sheet.findCell(utils::AddressParser::toReference(row, col)), sum, result);
        });
    }

    finish(function, sum, result);
    return result;
}

AggregateResult FormulaEvaluator::aggregate(AggregateFunction function,
                                            const std::vector<std::string>& references,
                                            const core::Sheet& sheet) {
    AggregateResult result;
    double sum = 0.0;
    for (const auto& ref : references) {
        accumulate(sheet.findCell(ref), sum, result);
    }
    finish(function, sum, result);
    return result;
}

}} // namespace sheetdrive::formula
