#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <expat.h>

namespace sheetdrive {
namespace xml {

/**
 * @brief 流式XML解析器，基于libexpat
 *
 * 与 XMLStreamWriter 配套：
 * - 基于libexpat的SAX解析
 * - 事件驱动的回调机制
 * - 便利的 parseToDOM，适合记录文件这种小文档
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

// XML属性，视图指向 expat 内部缓冲区，仅在回调期间有效
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

private:
    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attributes_;
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    size_t elements_parsed_ = 0;

    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    void flushText();
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void stopWithCallbackError(const char* stage, const std::exception& e);

public:
    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    XMLParseError parseFromString(std::string_view xml_content);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    // 简单的DOM风格元素（适合小文档）
    struct SimpleElement {
        std::string name;
        std::unordered_map<std::string, std::string> attributes;
        std::string text;
        std::vector<std::unique_ptr<SimpleElement>> children;
        SimpleElement* parent = nullptr;

        explicit SimpleElement(const std::string& n) : name(n) {}

        SimpleElement* findChild(const std::string& element_name) const;
        std::vector<SimpleElement*> findChildren(const std::string& element_name) const;

        std::string getAttribute(const std::string& attr_name, const std::string& defaultValue = "") const;
        bool hasAttribute(const std::string& attr_name) const;

        size_t getChildCount() const { return children.size(); }
    };

    /**
     * @brief 将整个文档解析为树结构
     * @return 根元素；解析失败返回 nullptr，错误信息见 getLastErrorMessage()
     */
    std::unique_ptr<SimpleElement> parseToDOM(std::string_view xml_content);
};

}} // namespace sheetdrive::xml
