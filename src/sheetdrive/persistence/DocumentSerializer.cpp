#include "sheetdrive/persistence/DocumentSerializer.hpp"
#include "sheetdrive/xml/XMLStreamWriter.hpp"
#include "sheetdrive/xml/XMLStreamReader.hpp"
#include "sheetdrive/utils/AddressParser.hpp"
#include "sheetdrive/utils/CommonUtils.hpp"
#include "sheetdrive/utils/XMLUtils.hpp"
#include "sheetdrive/utils/ModuleLoggers.hpp"
#include "sheetdrive/core/Exception.hpp"

namespace sheetdrive {
namespace persistence {

using Element = xml::XMLStreamReader::SimpleElement;

namespace {

constexpr const char* kCachedNumber = "number";
constexpr const char* kCachedText = "text";
constexpr const char* kBase64 = "base64";

core::Error corrupt(const std::string& message, const std::string& context = "") {
    return core::Error(core::ErrorCode::FileCorrupted, message, context);
}

// XML 无法原样承载的文本（非法 UTF-8、控制字符）按 Base64 保存，
// 并写出 <name>Encoding="base64" 标记
void writeTextAttribute(xml::XMLStreamWriter& writer, const std::string& name, const std::string& text) {
    if (utils::XMLUtils::isRepresentable(text)) {
        writer.writeAttribute(name, text);
        return;
    }
    writer.writeAttribute(name, utils::CommonUtils::base64Encode(text));
    writer.writeAttribute(name + "Encoding", kBase64);
}

core::Result<std::string> readTextAttribute(const Element& element, const std::string& name) {
    std::string raw = element.getAttribute(name);
    const std::string encoding = element.getAttribute(name + "Encoding");
    if (encoding.empty()) {
        return raw;
    }
    if (encoding != kBase64) {
        return corrupt("Unknown attribute encoding", name + "Encoding=" + encoding);
    }
    auto decoded = utils::CommonUtils::base64Decode(raw);
    if (!decoded) {
        return corrupt("Invalid base64 attribute", name);
    }
    return std::move(*decoded);
}

void writePropertyMap(xml::XMLStreamWriter& writer, const char* element,
                      const core::Sheet::PropertyMap& properties) {
    writer.startElement(element);
    for (const auto& [key, value] : properties) {
        writer.startElement("entry");
        writeTextAttribute(writer, "key", key);
        writeTextAttribute(writer, "value", value);
        writer.endElement();
    }
    writer.endElement();
}

void writeCell(xml::XMLStreamWriter& writer, const std::string& ref, const core::Cell& cell) {
    writer.startElement("cell");
    writer.writeAttribute("ref", ref);
    if (cell.isFormula()) {
        writeTextAttribute(writer, "formula", cell.getFormula());
        const auto& cached = cell.getCachedValue();
        if (cached) {
            writeTextAttribute(writer, "cachedValue", cached->toString());
            writer.writeAttribute("cachedType", cached->isNumber() ? kCachedNumber : kCachedText);
        }
    } else {
        writeTextAttribute(writer, "value", cell.getValue());
    }
    writer.endElement();
}

core::VoidResult readPropertyMap(const Element* parent, core::Sheet::PropertyMap& properties) {
    if (!parent) {
        return {};
    }
    for (const Element* entry : parent->findChildren("entry")) {
        if (!entry->hasAttribute("key")) {
            continue;
        }
        auto key = readTextAttribute(*entry, "key");
        if (!key) {
            return key.error();
        }
        auto value = readTextAttribute(*entry, "value");
        if (!value) {
            return value.error();
        }
        properties[std::move(key).value()] = std::move(value).value();
    }
    return {};
}

// 缓存值只是提示，无法解析时丢弃，加载后会重新计算
std::optional<core::EvaluationResult> readCachedValue(const Element& element) {
    if (!element.hasAttribute("cachedValue")) {
        return std::nullopt;
    }
    auto raw = readTextAttribute(element, "cachedValue");
    if (!raw) {
        return std::nullopt;
    }
    if (element.getAttribute("cachedType") == kCachedNumber) {
        auto number = utils::CommonUtils::parseDouble(raw.value());
        if (!number) {
            return std::nullopt;
        }
        return core::EvaluationResult::number(*number);
    }
    return core::EvaluationResult::text(std::move(raw).value());
}

core::Result<core::Sheet> readSheet(const Element& element) {
    if (!element.hasAttribute("id") || element.getAttribute("id").empty()) {
        return corrupt("Sheet without id");
    }

    auto name = readTextAttribute(element, "name");
    if (!name) {
        return name.error();
    }
    core::Sheet sheet(element.getAttribute("id"), std::move(name).value());

    if (const Element* cells = element.findChild("cells")) {
        for (const Element* cell_element : cells->findChildren("cell")) {
            if (!cell_element->hasAttribute("ref")) {
                return corrupt("Cell without ref", sheet.getId());
            }
            const std::string ref = cell_element->getAttribute("ref");
            if (!utils::AddressParser::isValidReference(ref)) {
                return corrupt("Invalid cell reference", ref);
            }

            auto formula_text = readTextAttribute(*cell_element, "formula");
            if (!formula_text) {
                return formula_text.error();
            }
            if (!formula_text.value().empty()) {
                sheet.putCell(ref, core::Cell::formula(std::move(formula_text).value(),
                                                       readCachedValue(*cell_element)));
                continue;
            }
            auto value = readTextAttribute(*cell_element, "value");
            if (!value) {
                return value.error();
            }
            sheet.putCell(ref, core::Cell::literal(std::move(value).value()));
        }
    }

    if (auto columns = readPropertyMap(element.findChild("columns"), sheet.columns()); !columns) {
        return columns.error();
    }
    if (auto rows = readPropertyMap(element.findChild("rows"), sheet.rows()); !rows) {
        return rows.error();
    }
    return sheet;
}

} // namespace

std::string DocumentSerializer::serialize(const core::Document& document) {
    return serialize(document, document.getMetadata());
}

std::string DocumentSerializer::serialize(const core::Document& document, const core::DocumentMetadata& metadata) {
    xml::XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("document");
    writer.writeAttribute("id", metadata.id);
    writeTextAttribute(writer, "name", metadata.name);
    writer.writeAttribute("createdAt", metadata.created_at);
    writer.writeAttribute("updatedAt", metadata.updated_at);
    writeTextAttribute(writer, "userId", metadata.user_id);

    writer.startElement("data");
    writer.writeAttribute("activeSheet", document.getActiveSheetId());

    for (const auto& sheet : document.sheets()) {
        writer.startElement("sheet");
        writer.writeAttribute("id", sheet.getId());
        writeTextAttribute(writer, "name", sheet.getName());

        writer.startElement("cells");
        for (const auto& [ref, cell] : sheet.cells()) {
            writeCell(writer, ref, cell);
        }
        writer.endElement();

        writePropertyMap(writer, "columns", sheet.columns());
        writePropertyMap(writer, "rows", sheet.rows());
        writer.endElement();  // sheet
    }

    writer.endElement();  // data
    writer.endElement();  // document
    writer.endDocument();

    XML_DEBUG("Serialized document '{}' ({} sheets, {} bytes)",
              metadata.id, document.getSheetCount(), writer.getBytesWritten());
    return writer.toString();
}

core::Result<core::Document> DocumentSerializer::deserialize(std::string_view content) {
    xml::XMLStreamReader reader;
    auto root = reader.parseToDOM(content);
    if (!root) {
        return corrupt("Malformed record", reader.getLastErrorMessage());
    }
    if (root->name != "document") {
        return corrupt("Unexpected root element", root->name);
    }
    if (!root->hasAttribute("id") || root->getAttribute("id").empty()) {
        return corrupt("Record without id");
    }

    const Element* data = root->findChild("data");
    if (!data) {
        return corrupt("Record without data", root->getAttribute("id"));
    }

    std::vector<core::Sheet> sheets;
    for (const Element* sheet_element : data->findChildren("sheet")) {
        auto sheet = readSheet(*sheet_element);
        if (!sheet) {
            return sheet.error();
        }
        sheets.push_back(std::move(sheet).value());
    }
    if (sheets.empty()) {
        return corrupt("Record without sheets", root->getAttribute("id"));
    }

    auto name = readTextAttribute(*root, "name");
    if (!name) {
        return name.error();
    }
    auto user_id = readTextAttribute(*root, "userId");
    if (!user_id) {
        return user_id.error();
    }

    core::DocumentMetadata metadata;
    metadata.id = root->getAttribute("id");
    metadata.name = std::move(name).value();
    metadata.created_at = root->getAttribute("createdAt");
    metadata.updated_at = root->getAttribute("updatedAt");
    metadata.user_id = std::move(user_id).value();

    try {
        return core::Document(std::move(sheets), data->getAttribute("activeSheet"), std::move(metadata));
    } catch (const core::SheetDriveException& e) {
        return corrupt(e.what(), root->getAttribute("id"));
    }
}

}} // namespace sheetdrive::persistence
