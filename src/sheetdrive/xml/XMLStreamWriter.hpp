/**
 * @file XMLStreamWriter.hpp
 * @brief 记录文件使用的XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>

namespace sheetdrive {
namespace xml {

/**
 * @brief 轻量XML流写入器
 *
 * 主要特性：
 * - 元素栈管理，endDocument 自动关闭未闭合元素
 * - 属性延迟写入，无子节点的元素输出为自闭合标签
 *
 * 属性值按原样转义输出，调用方负责保证内容是 XML 1.0 可表示的 UTF-8 文本
 * （见 XMLUtils::isRepresentable）。
 *
 * @example
 * XMLStreamWriter writer;
 * writer.startDocument();
 * writer.startElement("cell");
 * writer.writeAttribute("ref", "A1");
 * writer.endElement();
 * writer.endDocument();
 * std::string xml = writer.toString();
 */
class XMLStreamWriter {
private:
    std::string buffer_;

    std::stack<std::string> element_stack_;
    bool in_element_ = false;

    struct XMLAttribute {
        std::string key;
        std::string value;

        XMLAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };
    std::vector<XMLAttribute> pending_attributes_;

    void writeAttributesToBuffer();
    void ensureElementClosed();
    void requireOpenTag(const char* operation) const;

public:
    XMLStreamWriter();
    ~XMLStreamWriter();

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    void startDocument(const std::string& encoding = "UTF-8");
    void endDocument();

    /**
     * @throws ParameterException 元素名为空
     */
    void startElement(const std::string& name);

    /**
     * @throws OperationException 没有可关闭的元素
     */
    void endElement();

    /**
     * @brief 为当前打开的元素添加属性，值在输出时转义
     * @throws OperationException 当前不在开始标签内（已有子元素）
     * @throws ParameterException 值不是 XML 1.0 可表示的 UTF-8 文本
     */
    void writeAttribute(const std::string& name, std::string_view value);

    const std::string& toString() const { return buffer_; }

    size_t getBytesWritten() const { return buffer_.size(); }
    size_t getOpenElementCount() const { return element_stack_.size(); }
};

}} // namespace sheetdrive::xml
