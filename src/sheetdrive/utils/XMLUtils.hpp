#pragma once

#include "sheetdrive/xml/XMLEscapes.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <utf8.h>

namespace sheetdrive {
namespace utils {

/**
 * @brief XML工具类 - 提供XML相关的辅助函数
 */
class XMLUtils {
public:
  /**
   * @brief 判断文本能否原样写入 XML 1.0 属性
   *
   * 要求是合法的 UTF-8，且不含 XML 1.0 Char 产生式之外的码点
   * （制表符、换行符、回车符以外的 C0 控制字符，以及 U+FFFE / U+FFFF）。
   */
  static bool isRepresentable(std::string_view text) {
    if (!utf8::is_valid(text.begin(), text.end())) {
      return false;
    }
    auto it = text.begin();
    while (it != text.end()) {
      const std::uint32_t cp = utf8::unchecked::next(it);
      if (cp < 0x20 && cp != '\t' && cp != '\n' && cp != '\r') {
        return false;
      }
      if (cp == 0xFFFE || cp == 0xFFFF) {
        return false;
      }
    }
    return true;
  }

  /**
   * @brief 属性值转义
   *
   * 转义规则：
   * - < -> &lt;
   * - > -> &gt;
   * - & -> &amp;
   * - " -> &quot;
   * - ' -> &apos;
   * - 制表符、换行符、回车符写成字符引用，使属性值经过解析器的空白规范化之后仍能原样还原
   */
  static std::string escapeAttribute(std::string_view value) {
    std::string result;
    result.reserve(value.size() + value.size() / 8);
    appendEscapedAttribute(result, value);
    return result;
  }

  static void appendEscapedAttribute(std::string& target, std::string_view source) {
    for (char c : source) {
      switch (c) {
      case '<':
        target += xml::XMLEscapes::LT;
        break;
      case '>':
        target += xml::XMLEscapes::GT;
        break;
      case '&':
        target += xml::XMLEscapes::AMP;
        break;
      case '"':
        target += xml::XMLEscapes::QUOT;
        break;
      case '\'':
        target += xml::XMLEscapes::APOS;
        break;
      case '\t':
        target += xml::XMLEscapes::TAB;
        break;
      case '\n':
        target += xml::XMLEscapes::NL;
        break;
      case '\r':
        target += xml::XMLEscapes::CR;
        break;
      default:
        target.push_back(c);
        break;
      }
    }
  }
};

}} // namespace sheetdrive::utils
