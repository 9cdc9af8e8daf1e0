#pragma once

#include <string>
#include <variant>

namespace sheetdrive {
namespace core {

/**
 * @brief 公式求值结果：数值或文本
 *
 * 数值按最短往返形式渲染，整数值不带小数部分（5、3.5、0）。
 */
class EvaluationResult {
public:
    static EvaluationResult number(double value) {
        return EvaluationResult(Storage(std::in_place_index<0>, value));
    }

    static EvaluationResult text(std::string value) {
        return EvaluationResult(Storage(std::in_place_index<1>, std::move(value)));
    }

    bool isNumber() const noexcept { return value_.index() == 0; }
    bool isText() const noexcept { return value_.index() == 1; }

    /**
     * @brief 数值，文本结果返回 0
     */
    double numberValue() const noexcept {
        return isNumber() ? std::get<0>(value_) : 0.0;
    }

    /**
     * @brief 文本，数值结果返回空串
     */
    const std::string& textValue() const noexcept;

    /**
     * @brief 显示字符串
     */
    std::string toString() const;

    /**
     * @brief 数值按位比较，NaN 与 NaN 视为相等
     */
    bool operator==(const EvaluationResult& other) const;
    bool operator!=(const EvaluationResult& other) const { return !(*this == other); }

private:
    using Storage = std::variant<double, std::string>;

    explicit EvaluationResult(Storage value) : value_(std::move(value)) {}

    Storage value_;
};

}} // namespace sheetdrive::core
