#pragma once

#include <cstddef>

namespace sheetdrive {
namespace xml {

// XML 转义常量：集中提供实体字面量
struct XMLEscapes {
    inline static constexpr char AMP[]  = "&amp;";   // &  → &amp;
    inline static constexpr char LT[]   = "&lt;";    // <  → &lt;
    inline static constexpr char GT[]   = "&gt;";    // >  → &gt;
    inline static constexpr char QUOT[] = "&quot;";  // " → &quot;
    inline static constexpr char APOS[] = "&apos;";  // '  → &apos;

    // 属性上下文中的空白字符，必须写成字符引用，否则会被属性值规范化为空格
    inline static constexpr char TAB[]  = "&#x9;";
    inline static constexpr char NL[]   = "&#xA;";
    inline static constexpr char CR[]   = "&#xD;";

    inline static constexpr char TAG_OPEN    = '<';
    inline static constexpr char TAG_CLOSE   = '>';
    inline static constexpr char ATTR_QUOTE  = '"';
    inline static constexpr char SPACE       = ' ';
};

}} // namespace sheetdrive::xml
