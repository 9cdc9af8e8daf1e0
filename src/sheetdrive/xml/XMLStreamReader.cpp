#include "sheetdrive/xml/XMLStreamReader.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include <climits>
#include <cstring>
#include <stack>
#include <fmt/format.h>

namespace sheetdrive {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attributes_.reserve(16);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    parser_ = XML_ParserCreate("UTF-8");
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attributes_.clear();
    current_text_.clear();
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    if (xml_content.empty() || xml_content.size() > static_cast<size_t>(INT_MAX)) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }
    resetState();

    if (XML_Parse(parser_, xml_content.data(), static_cast<int>(xml_content.size()), 1) == XML_STATUS_ERROR) {
        // 回调失败时 XML_StopParser 已记录了原因
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    XML_TRACE("Successfully parsed {} bytes, {} elements", xml_content.size(), elements_parsed_);
    return XMLParseError::Ok;
}

// libexpat回调函数实现
void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->flushText();
    reader->elements_parsed_++;

    reader->attributes_.clear();
    if (attrs) {
        for (int i = 0; attrs[i] && attrs[i + 1]; i += 2) {
            reader->attributes_.emplace_back(
                std::string_view{attrs[i], std::strlen(attrs[i])},
                std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(std::string_view{name, std::strlen(name)},
                                            reader->attributes_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopWithCallbackError("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->flushText();
    reader->current_depth_--;

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(std::string_view{name, std::strlen(name)}, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopWithCallbackError("End element", e);
        }
    }
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

void XMLStreamReader::flushText() {
    if (current_text_.empty()) {
        return;
    }

    // 记录文件的缩进空白不属于内容
    std::string_view text_content = trimStringView(current_text_);

    if (!text_content.empty() && text_callback_) {
        try {
            text_callback_(text_content, current_depth_);
        } catch (const std::exception& e) {
            stopWithCallbackError("Text", e);
        }
    }
    current_text_.clear();
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_DEBUG("XML parse error: {}", message);
}

void XMLStreamReader::stopWithCallbackError(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

// SimpleElement 实现
XMLStreamReader::SimpleElement* XMLStreamReader::SimpleElement::findChild(const std::string& element_name) const {
    for (const auto& child : children) {
        if (child->name == element_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<XMLStreamReader::SimpleElement*> XMLStreamReader::SimpleElement::findChildren(const std::string& element_name) const {
    std::vector<SimpleElement*> result;
    for (const auto& child : children) {
        if (child->name == element_name) {
            result.push_back(child.get());
        }
    }
    return result;
}

std::string XMLStreamReader::SimpleElement::getAttribute(const std::string& attr_name, const std::string& defaultValue) const {
    auto it = attributes.find(attr_name);
    return it != attributes.end() ? it->second : defaultValue;
}

bool XMLStreamReader::SimpleElement::hasAttribute(const std::string& attr_name) const {
    return attributes.find(attr_name) != attributes.end();
}

// DOM解析实现
std::unique_ptr<XMLStreamReader::SimpleElement> XMLStreamReader::parseToDOM(std::string_view xml_content) {
    std::unique_ptr<SimpleElement> root;
    std::stack<SimpleElement*> element_stack;

    setStartElementCallback([&](std::string_view element_name, const std::vector<XMLAttribute>& attributes, int /*depth*/) {
        auto element = std::make_unique<SimpleElement>(std::string(element_name));

        // DOM 需要保存数据，这里拷贝属性
        for (const auto& attr : attributes) {
            element->attributes[std::string(attr.name)] = std::string(attr.value);
        }

        SimpleElement* element_ptr = element.get();
        if (element_stack.empty()) {
            root = std::move(element);
        } else {
            element_ptr->parent = element_stack.top();
            element_stack.top()->children.push_back(std::move(element));
        }
        element_stack.push(element_ptr);
    });

    setEndElementCallback([&](std::string_view /*element_name*/, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.pop();
        }
    });

    setTextCallback([&](std::string_view text, int /*depth*/) {
        if (!element_stack.empty()) {
            element_stack.top()->text += std::string(text);
        }
    });

    XMLParseError result = parseFromString(xml_content);

    start_element_callback_ = nullptr;
    end_element_callback_ = nullptr;
    text_callback_ = nullptr;

    if (result != XMLParseError::Ok) {
        XML_DEBUG("Failed to parse XML to DOM: {}", last_error_message_);
        return nullptr;
    }
    return root;
}

}} // namespace sheetdrive::xml
