#pragma once

#include "sheetdrive/core/EvaluationResult.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <cstdint>

namespace sheetdrive {
namespace core {

enum class CellType : uint8_t {
    Empty = 0,
    Literal = 1,
    Formula = 2
};

/**
 * @brief 单个字段的部分更新：保持 / 设置 / 清除
 */
template<typename T>
class FieldUpdate {
public:
    enum class Op : uint8_t { Keep, Set, Clear };

    FieldUpdate() = default;

    static FieldUpdate set(T value) {
        FieldUpdate u;
        u.op_ = Op::Set;
        u.value_.emplace(std::move(value));
        return u;
    }

    static FieldUpdate clear() {
        FieldUpdate u;
        u.op_ = Op::Clear;
        return u;
    }

    Op op() const noexcept { return op_; }
    bool isKeep() const noexcept { return op_ == Op::Keep; }
    bool isSet() const noexcept { return op_ == Op::Set; }
    bool isClear() const noexcept { return op_ == Op::Clear; }
    bool touches() const noexcept { return op_ != Op::Keep; }

    /**
     * @brief 设置的值，仅 isSet() 时有效
     */
    const T& value() const noexcept { return *value_; }

private:
    Op op_ = Op::Keep;
    std::optional<T> value_;
};

/**
 * @brief 单元格部分更新
 *
 * 三个字段（value、formula、cached_value）各自可以保持、设置或清除。
 * 只设置 value 时隐式清除 formula，只设置 formula 时隐式清除 value；
 * 两者同时设置时以 formula 为准。
 */
struct CellUpdate {
    FieldUpdate<std::string> value;
    FieldUpdate<std::string> formula;
    FieldUpdate<EvaluationResult> cached_value;

    /**
     * @brief 写入字面值（清除公式）
     */
    static CellUpdate literal(std::string text);

    /**
     * @brief 写入公式（清除字面值）
     */
    static CellUpdate makeFormula(std::string text);

    /**
     * @brief 按用户输入构造：以前缀开头即为公式，否则为字面值
     */
    static CellUpdate fromInput(std::string text, char formula_prefix = '=');

    /**
     * @brief 清空单元格
     */
    static CellUpdate clearAll();

    /**
     * @brief 是否触及内容字段（value 或 formula），决定是否触发整表重算
     */
    bool touchesContent() const noexcept {
        return value.touches() || formula.touches();
    }
};

/**
 * @brief 单元格：Empty | Literal(text) | Formula(text, cached)
 *
 * 字面值与公式互斥由变体保证。空字面值和空公式都归一为 Empty。
 */
class Cell {
public:
    Cell() = default;

    static Cell literal(std::string text);
    static Cell formula(std::string text, std::optional<EvaluationResult> cached = std::nullopt);

    CellType getType() const noexcept;
    bool isEmpty() const noexcept { return getType() == CellType::Empty; }
    bool isLiteral() const noexcept { return getType() == CellType::Literal; }
    bool isFormula() const noexcept { return getType() == CellType::Formula; }

    /**
     * @brief 字面值文本，非字面值单元格返回空串
     */
    const std::string& getValue() const noexcept;

    /**
     * @brief 公式文本（含前缀），非公式单元格返回空串
     */
    const std::string& getFormula() const noexcept;

    /**
     * @brief 公式的缓存结果，非公式单元格为空
     */
    const std::optional<EvaluationResult>& getCachedValue() const noexcept;

    /**
     * @brief 设置缓存结果，只对公式单元格生效
     */
    void setCachedValue(std::optional<EvaluationResult> cached);

    /**
     * @brief 显示值
     *
     * 公式：缓存结果的字符串形式，未求值时显示公式本身；
     * 字面值：原文；空：空串。
     */
    std::string displayValue() const;

    /**
     * @brief 编辑栏中的文本：公式单元格为公式，字面值单元格为原文
     */
    std::string editText() const;

    /**
     * @brief 合并部分更新
     */
    void apply(const CellUpdate& update);

    bool operator==(const Cell& other) const;
    bool operator!=(const Cell& other) const { return !(*this == other); }

private:
    struct LiteralData {
        std::string text;
    };
    struct FormulaData {
        std::string text;
        std::optional<EvaluationResult> cached;
    };

    std::variant<std::monostate, LiteralData, FormulaData> data_;
};

}} // namespace sheetdrive::core
