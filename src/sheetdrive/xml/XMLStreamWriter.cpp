#include "XMLStreamWriter.hpp"
#include "sheetdrive/utils/XMLUtils.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include "sheetdrive/core/Exception.hpp"

namespace sheetdrive {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    pending_attributes_.reserve(8);
}

XMLStreamWriter::~XMLStreamWriter() {
    if (!element_stack_.empty()) {
        XML_WARN("XMLStreamWriter destroyed with {} unclosed elements", element_stack_.size());
    }
}

void XMLStreamWriter::startDocument(const std::string& encoding) {
    buffer_ += "<?xml version=\"1.0\" encoding=\"";
    buffer_ += encoding;
    buffer_ += "\"?>\n";
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        XML_WARN("Auto-closing unclosed element: {}", element_stack_.top());
        endElement();
    }
    buffer_ += '\n';
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        SHEETDRIVE_THROW(core::ParameterException, "Element name cannot be empty", "name");
    }

    ensureElementClosed();

    buffer_ += XMLEscapes::TAG_OPEN;
    buffer_ += name;

    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        SHEETDRIVE_THROW(core::OperationException, "No element to close", "endElement",
                         core::ErrorCode::InvalidArgument);
    }

    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_ += "/>";
        in_element_ = false;
    } else {
        buffer_ += "</";
        buffer_ += element_name;
        buffer_ += XMLEscapes::TAG_CLOSE;
    }
}

void XMLStreamWriter::requireOpenTag(const char* operation) const {
    if (!in_element_) {
        SHEETDRIVE_THROW(core::OperationException,
                         "Cannot write attribute outside of element", operation,
                         core::ErrorCode::InvalidArgument);
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    requireOpenTag("writeAttribute");
    if (name.empty()) {
        SHEETDRIVE_THROW(core::ParameterException, "Attribute name cannot be empty", "name");
    }
    if (!utils::XMLUtils::isRepresentable(value)) {
        SHEETDRIVE_THROW(core::ParameterException, "Attribute value is not representable in XML", name);
    }
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_ += XMLEscapes::TAG_CLOSE;
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_ += XMLEscapes::SPACE;
        buffer_ += attr.key;
        buffer_ += '=';
        buffer_ += XMLEscapes::ATTR_QUOTE;
        utils::XMLUtils::appendEscapedAttribute(buffer_, attr.value);
        buffer_ += XMLEscapes::ATTR_QUOTE;
    }
    pending_attributes_.clear();
}

}} // namespace sheetdrive::xml
