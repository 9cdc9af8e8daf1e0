#pragma once

#include "sheetdrive/core/EvaluationResult.hpp"
#include "sheetdrive/core/CellAddress.hpp"
#include "sheetdrive/core/Sheet.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

namespace sheetdrive {
namespace formula {

enum class AggregateFunction {
    Sum,
    Average
};

/**
 * @brief 聚合结果
 *
 * counted 为参与计算的数值个数；skipped 为存在且非空、但无法解析为数值的字面值个数。
 * 公式单元格与空单元格两者都不计。
 */
struct AggregateResult {
    double value = 0.0;
    size_t counted = 0;
    size_t skipped = 0;
};

/**
 * @brief 公式求值器
 *
 * 支持的语法（关键字区分大小写，主体必须以 ')' 结尾）：
 * - SUM(A1:B3)     范围求和
 * - SUM(A1, B1)    列表求和
 * - AVERAGE(A1:B3) 范围平均，仅支持范围形式
 *
 * 其余形式一律返回去掉前缀后的公式文本。求值从不抛异常。
 *
 * @example
 * FormulaEvaluator evaluator;
 * auto result = evaluator.evaluate("=SUM(A1:A3)", sheet);
 * std::string shown = result.toString();
 */
class FormulaEvaluator {
public:
    explicit FormulaEvaluator(char formula_prefix = '=');

    /**
     * @brief 对一个公式求值
     */
    core::EvaluationResult evaluate(std::string_view formula_text, const core::Sheet& sheet) const;

    /**
     * @brief 重新计算工作表中所有公式单元格的缓存结果
     * @return 求值的公式个数
     */
    size_t evaluateSheet(core::Sheet& sheet) const;

    /**
     * @brief 范围聚合
     */
    static AggregateResult aggregate(AggregateFunction function,
                                     const core::CellRange& range,
                                     const core::Sheet& sheet);

    /**
     * @brief 列表聚合，每一项按原样精确查找（不是合法引用的项不贡献任何值）
     */
    static AggregateResult aggregate(AggregateFunction function,
                                     const std::vector<std::string>& references,
                                     const core::Sheet& sheet);

    /**
     * @brief 去掉前缀和首尾空白后的公式主体
     */
    std::string_view stripFormula(std::string_view formula_text) const;

    char getFormulaPrefix() const { return formula_prefix_; }

private:
    char formula_prefix_;

    static bool tryParseRange(std::string_view args, core::CellRange& out);
    static void accumulate(const core::Cell* cell, double& sum, AggregateResult& result);
    static void finish(AggregateFunction function, double sum, AggregateResult& result);
};

}} // namespace sheetdrive::formula
