#include <gtest/gtest.h>
#include "sheetdrive/xml/XMLStreamWriter.hpp"
#include "sheetdrive/xml/XMLStreamReader.hpp"
#include "sheetdrive/utils/XMLUtils.hpp"
#include "sheetdrive/core/Exception.hpp"
#include <string>
#include <vector>

namespace sheetdrive {
namespace xml {

class XMLStreamWriterTest : public ::testing::Test {
protected:
    XMLStreamWriter writer;
};

TEST_F(XMLStreamWriterTest, WritesNestedElements) {
    writer.startDocument();
    writer.startElement("root");
    writer.writeAttribute("version", "2");
    writer.startElement("child");
    writer.writeAttribute("name", "a");
    writer.endElement();
    writer.startElement("list");
    writer.startElement("item");
    writer.endElement();
    writer.endElement();
    writer.endElement();
    writer.endDocument();

    EXPECT_EQ(writer.toString(),
              "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
              "<root version=\"2\"><child name=\"a\"/><list><item/></list></root>\n");
    EXPECT_EQ(writer.getOpenElementCount(), 0u);
    EXPECT_EQ(writer.getBytesWritten(), writer.toString().size());
}

TEST_F(XMLStreamWriterTest, EscapesAttributes) {
    writer.startElement("e");
    writer.writeAttribute("v", "a<b & \"c\" 'd'\tx\ny\rz");
    writer.endElement();

    EXPECT_EQ(writer.toString(),
              "<e v=\"a&lt;b &amp; &quot;c&quot; &apos;d&apos;&#x9;x&#xA;y&#xD;z\"/>");
    // UTF-8 多字节字符原样保留
    EXPECT_EQ(utils::XMLUtils::escapeAttribute("数据 > 0"), "数据 &gt; 0");
}

TEST_F(XMLStreamWriterTest, DetectsUnrepresentableText) {
    EXPECT_TRUE(utils::XMLUtils::isRepresentable(""));
    EXPECT_TRUE(utils::XMLUtils::isRepresentable("tab\there\r\n"));
    EXPECT_TRUE(utils::XMLUtils::isRepresentable("caf\xC3\xA9 数据"));

    EXPECT_FALSE(utils::XMLUtils::isRepresentable("caf\xE9"));           // Latin-1
    EXPECT_FALSE(utils::XMLUtils::isRepresentable("a\x01" "b"));
    EXPECT_FALSE(utils::XMLUtils::isRepresentable(std::string("nul\0", 4)));
    EXPECT_FALSE(utils::XMLUtils::isRepresentable("\xEF\xBF\xBE"));     // U+FFFE
    EXPECT_FALSE(utils::XMLUtils::isRepresentable("\xED\xA0\x80"));     // 代理项

    writer.startElement("e");
    EXPECT_THROW(writer.writeAttribute("v", "caf\xE9"), core::ParameterException);
    EXPECT_THROW(writer.writeAttribute("v", "a\x1b"), core::ParameterException);
    writer.endElement();
    EXPECT_EQ(writer.toString(), "<e/>");
}

TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElements) {
    writer.startElement("a");
    writer.startElement("b");
    writer.endDocument();
    EXPECT_EQ(writer.toString(), "<a><b/></a>\n");
}

TEST_F(XMLStreamWriterTest, RejectsMisuse) {
    EXPECT_THROW(writer.endElement(), core::OperationException);
    EXPECT_THROW(writer.writeAttribute("x", "1"), core::OperationException);
    EXPECT_THROW(writer.startElement(""), core::ParameterException);

    writer.startElement("a");
    EXPECT_THROW(writer.writeAttribute("", "1"), core::ParameterException);
    writer.startElement("b");
    writer.endElement();
    EXPECT_THROW(writer.writeAttribute("late", "1"), core::OperationException);
    writer.endElement();
}

// ========== XMLStreamReader ==========

class XMLStreamReaderTest : public ::testing::Test {
protected:
    XMLStreamReader reader;

    const std::string sample = R"(<?xml version="1.0" encoding="UTF-8"?>
<root>
    <element attr="value">Text content</element>
    <empty_element/>
    <parent>
        <child>Child text</child>
        <child>Another child</child>
    </parent>
</root>)";
};

TEST_F(XMLStreamReaderTest, StreamsElementsWithDepth) {
    std::vector<std::string> starts;
    std::vector<int> depths;
    std::vector<std::string> texts;

    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>& attributes, int depth) {
        starts.emplace_back(name);
        depths.push_back(depth);
        if (name == "element") {
            ASSERT_EQ(attributes.size(), 1u);
            EXPECT_EQ(attributes[0].name, "attr");
            EXPECT_EQ(attributes[0].value, "value");
        }
    });
    reader.setTextCallback([&](std::string_view text, int) {
        texts.emplace_back(text);
    });

    ASSERT_EQ(reader.parseFromString(sample), XMLParseError::Ok);
    EXPECT_EQ(starts, (std::vector<std::string>{"root", "element", "empty_element", "parent", "child", "child"}));
    EXPECT_EQ(depths, (std::vector<int>{0, 1, 1, 1, 2, 2}));
    EXPECT_EQ(texts, (std::vector<std::string>{"Text content", "Child text", "Another child"}));
    EXPECT_EQ(reader.getElementsParsed(), 6u);
}

TEST_F(XMLStreamReaderTest, ParseToDOM) {
    auto root = reader.parseToDOM(sample);
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "root");
    EXPECT_EQ(root->getChildCount(), 3u);

    auto* element = root->findChild("element");
    ASSERT_NE(element, nullptr);
    EXPECT_EQ(element->getAttribute("attr"), "value");
    EXPECT_EQ(element->getAttribute("missing", "fallback"), "fallback");
    EXPECT_FALSE(element->hasAttribute("missing"));
    EXPECT_EQ(element->text, "Text content");

    auto children = root->findChild("parent")->findChildren("child");
    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[1]->text, "Another child");
    EXPECT_EQ(children[1]->parent, root->findChild("parent"));
}

TEST_F(XMLStreamReaderTest, ReportsMalformedInput) {
    EXPECT_EQ(reader.parseFromString(""), XMLParseError::InvalidInput);
    EXPECT_EQ(reader.parseFromString("<a><b></a>"), XMLParseError::ParseFailed);
    EXPECT_FALSE(reader.getLastErrorMessage().empty());

    EXPECT_EQ(reader.parseToDOM("<unclosed>"), nullptr);
    EXPECT_EQ(reader.getLastError(), XMLParseError::ParseFailed);
}

TEST_F(XMLStreamReaderTest, CallbackExceptionStopsParsing) {
    int seen = 0;
    reader.setStartElementCallback([&](std::string_view name, const std::vector<XMLAttribute>&, int) {
        ++seen;
        if (name == "empty_element") {
            throw std::runtime_error("boom");
        }
    });
    EXPECT_EQ(reader.parseFromString(sample), XMLParseError::CallbackError);
    EXPECT_EQ(seen, 3);
    EXPECT_NE(reader.getLastErrorMessage().find("boom"), std::string::npos);
}

// 写出的字符引用经解析器还原为原始字符
TEST_F(XMLStreamReaderTest, AttributeWhitespaceSurvivesRoundTrip) {
    const std::string original = "line1\nline2\tTab\r<&>\"'";

    XMLStreamWriter writer;
    writer.startElement("cell");
    writer.writeAttribute("value", original);
    writer.endElement();
    writer.endDocument();

    auto root = reader.parseToDOM(writer.toString());
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->getAttribute("value"), original);
}

}} // namespace sheetdrive::xml
