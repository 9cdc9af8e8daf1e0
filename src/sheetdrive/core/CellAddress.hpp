#pragma once

#include "sheetdrive/utils/AddressParser.hpp"
#include "sheetdrive/core/Exception.hpp"
#include <string>
#include <string_view>
#include <algorithm>

namespace sheetdrive {
namespace core {

/**
 * @brief 单元格地址 - 支持隐式转换
 *
 * - Address("B3") - 字符串地址
 * - Address(2, 1) - 行列坐标（0基）
 */
class Address {
private:
    int row_;
    int col_;

public:
    /**
     * @throws ParameterException 行列为负数
     */
    Address(int row, int col)
        : row_(row), col_(col) {
        if (row < 0 || col < 0) {
            SHEETDRIVE_THROW(ParameterException, "Row and column indices cannot be negative", "address");
        }
    }

    /**
     * @throws AddressParseException 引用格式错误
     */
    Address(std::string_view reference) {
        auto [row, col] = utils::AddressParser::parseReference(reference);
        row_ = row;
        col_ = col;
    }

    Address(const std::string& reference) : Address(std::string_view(reference)) {}
    Address(const char* reference) : Address(std::string_view(reference)) {}

    int getRow() const { return row_; }
    int getCol() const { return col_; }

    std::string toString() const {
        return utils::AddressParser::toReference(row_, col_);
    }

    bool operator==(const Address& other) const {
        return row_ == other.row_ && col_ == other.col_;
    }

    bool operator!=(const Address& other) const {
        return !(*this == other);
    }

    bool operator<(const Address& other) const {
        if (row_ != other.row_) return row_ < other.row_;
        return col_ < other.col_;
    }
};

/**
 * @brief 矩形单元格范围
 *
 * 两个角的行、列分别取最小/最大值归一化，"B3:A1" 与 "A1:B3" 等价。
 */
class CellRange {
private:
    int start_row_;
    int start_col_;
    int end_row_;
    int end_col_;

public:
    CellRange(const Address& first, const Address& second)
        : start_row_(std::min(first.getRow(), second.getRow())),
          start_col_(std::min(first.getCol(), second.getCol())),
          end_row_(std::max(first.getRow(), second.getRow())),
          end_col_(std::max(first.getCol(), second.getCol())) {}

    /**
     * @brief 单个地址构造1x1范围
     */
    CellRange(const Address& address)
        : CellRange(address, address) {}

    int getStartRow() const { return start_row_; }
    int getStartCol() const { return start_col_; }
    int getEndRow() const { return end_row_; }
    int getEndCol() const { return end_col_; }

    /**
     * @brief 行数（用 long long 防止极端坐标相减溢出）
     */
    long long getRowCount() const { return static_cast<long long>(end_row_) - start_row_ + 1; }
    long long getColCount() const { return static_cast<long long>(end_col_) - start_col_ + 1; }
    long long getCellCount() const { return getRowCount() * getColCount(); }

    bool isSingleCell() const {
        return start_row_ == end_row_ && start_col_ == end_col_;
    }

    bool contains(const Address& address) const {
        return address.getRow() >= start_row_ && address.getRow() <= end_row_ &&
               address.getCol() >= start_col_ && address.getCol() <= end_col_;
    }

    std::string toString() const {
        return utils::AddressParser::toReference(start_row_, start_col_) + ":" +
               utils::AddressParser::toReference(end_row_, end_col_);
    }

    /**
     * @brief 行优先遍历范围内所有坐标
     */
    template<typename Func>
    void forEach(Func&& func) const {
        for (int r = start_row_; ; ++r) {
            for (int c = start_col_; ; ++c) {
                func(r, c);
                if (c == end_col_) break;
            }
            if (r == end_row_) break;
        }
    }

    bool operator==(const CellRange& other) const {
        return start_row_ == other.start_row_ && start_col_ == other.start_col_ &&
               end_row_ == other.end_row_ && end_col_ == other.end_col_;
    }
};

}} // namespace sheetdrive::core
