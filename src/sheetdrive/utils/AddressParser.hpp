#pragma once

#include "sheetdrive/core/Expected.hpp"
#include <string>
#include <string_view>
#include <utility>

namespace sheetdrive {
namespace utils {

/**
 * @brief 单元格地址编解码
 *
 * 列号使用双射26进制（没有"零"字母）：
 * 0 -> "A", 25 -> "Z", 26 -> "AA", 701 -> "ZZ", 702 -> "AAA"。
 * 引用格式为"大写字母 + 正整数"，如 "B3" 对应 (row=2, col=1)，索引均基于0。
 *
 * @example
 * AddressParser::toReference(2, 1);          // "B3"
 * auto [row, col] = AddressParser::parseReference("AA10"); // (9, 26)
 */
class AddressParser {
public:
    using Position = std::pair<int, int>;  // (row, col)

    /**
     * @brief 列索引转列字母
     * @throws ParameterException index 为负数
     */
    static std::string encodeColumn(int index);

    /**
     * @brief 列字母转列索引，输入必须匹配 [A-Z]+
     * @throws AddressParseException 非法字符、空串或溢出
     */
    static int decodeColumn(std::string_view letters);

    /**
     * @brief 行列索引转引用字符串
     * @throws ParameterException 行或列为负数
     */
    static std::string toReference(int row, int col);

    /**
     * @brief 解析引用字符串
     * @throws AddressParseException 不匹配"字母+数字"格式或行号不是正整数
     */
    static Position parseReference(std::string_view text);

    /**
     * @brief 不抛异常的解析，供求值等热路径使用
     */
    static core::Result<Position> tryParseReference(std::string_view text);

    static bool isValidReference(std::string_view text) {
        return tryParseReference(text).hasValue();
    }

private:
    static bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }
    static bool isDigit(char c) { return c >= '0' && c <= '9'; }
};

}} // namespace sheetdrive::utils
