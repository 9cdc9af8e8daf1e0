#include <gtest/gtest.h>
#include "sheetdrive/persistence/DocumentSerializer.hpp"
#include "sheetdrive/xml/XMLStreamReader.hpp"

using namespace sheetdrive;
using core::CellUpdate;
using persistence::DocumentSerializer;

class DocumentSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::DocumentMetadata metadata;
        metadata.id = "doc-1";
        metadata.name = "Budget";
        metadata.created_at = "2024-01-01T00:00:00Z";
        metadata.updated_at = "2024-01-02T00:00:00Z";
        metadata.user_id = "1";
        doc.setMetadata(metadata);
    }

    core::Document roundTrip(const core::Document& source) {
        auto parsed = DocumentSerializer::deserialize(DocumentSerializer::serialize(source));
        EXPECT_TRUE(parsed.hasValue()) << (parsed ? "" : parsed.error().fullMessage());
        return parsed ? std::move(parsed).value() : core::Document();
    }

    core::Document doc;
};

TEST_F(DocumentSerializerTest, WritesExpectedStructure) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("5"));
    doc.setCell("sheet1", "A2", CellUpdate::makeFormula("=SUM(A1:A1)"));

    xml::XMLStreamReader reader;
    auto root = reader.parseToDOM(DocumentSerializer::serialize(doc));
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->name, "document");
    EXPECT_EQ(root->getAttribute("id"), "doc-1");
    EXPECT_EQ(root->getAttribute("name"), "Budget");
    EXPECT_EQ(root->getAttribute("createdAt"), "2024-01-01T00:00:00Z");
    EXPECT_EQ(root->getAttribute("userId"), "1");

    auto* data = root->findChild("data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->getAttribute("activeSheet"), "sheet1");

    auto* sheet = data->findChild("sheet");
    ASSERT_NE(sheet, nullptr);
    auto cells = sheet->findChild("cells")->findChildren("cell");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0]->getAttribute("ref"), "A1");
    EXPECT_EQ(cells[0]->getAttribute("value"), "5");
    EXPECT_FALSE(cells[0]->hasAttribute("formula"));
    EXPECT_EQ(cells[1]->getAttribute("formula"), "=SUM(A1:A1)");
    EXPECT_EQ(cells[1]->getAttribute("cachedValue"), "5");
    EXPECT_EQ(cells[1]->getAttribute("cachedType"), "number");
    EXPECT_NE(sheet->findChild("columns"), nullptr);
    EXPECT_NE(sheet->findChild("rows"), nullptr);
}

TEST_F(DocumentSerializerTest, RoundTripPreservesContent) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("1"));
    doc.setCell("sheet1", "B1", CellUpdate::makeFormula("=AVERAGE(A1,B1)"));
    std::string second = doc.addSheet();
    doc.renameSheet(second, "Notes");
    doc.setCell(second, "C3", CellUpdate::literal("hello"));
    doc.setActiveSheet("sheet1");

    core::Document restored = roundTrip(doc);
    EXPECT_EQ(restored.listSheets(), doc.listSheets());
    EXPECT_EQ(restored.getActiveSheetId(), "sheet1");
    EXPECT_EQ(restored.getMetadata().name, "Budget");
    EXPECT_EQ(restored.getMetadata().updated_at, "2024-01-02T00:00:00Z");
    EXPECT_EQ(restored.displayValue("sheet1", "B1"), "AVERAGE(A1,B1)");
    EXPECT_TRUE(restored.getCell("sheet1", "B1").getCachedValue()->isText());
    EXPECT_EQ(restored.displayValue(second, "C3"), "hello");
    EXPECT_FALSE(restored.isDirty());
}

// 特殊字符、制表符与换行逐字节还原
TEST_F(DocumentSerializerTest, SpecialCharactersRoundTrip) {
    const std::string tricky = "a < b && c > \"d\" 'e'\tf\ng\r\nh";
    doc.setCell("sheet1", "A1", CellUpdate::literal(tricky));
    doc.renameSheet("sheet1", "Q&A <draft>");
    core::DocumentMetadata metadata = doc.getMetadata();
    metadata.name = "Tom's \"plan\"";
    doc.setMetadata(metadata);

    core::Document restored = roundTrip(doc);
    EXPECT_EQ(restored.getCell("sheet1", "A1").getValue(), tricky);
    EXPECT_EQ(restored.getSheet("sheet1").getName(), "Q&A <draft>");
    EXPECT_EQ(restored.getMetadata().name, "Tom's \"plan\"");
}

// 非法 UTF-8 与控制字符无法直接写入 XML，改用 Base64 保存
TEST_F(DocumentSerializerTest, UnrepresentableTextIsEncoded) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("caf\xE9"));
    doc.setCell("sheet1", "A2", CellUpdate::literal("plain"));

    xml::XMLStreamReader reader;
    auto root = reader.parseToDOM(DocumentSerializer::serialize(doc));
    ASSERT_NE(root, nullptr);
    auto cells = root->findChild("data")->findChild("sheet")->findChild("cells")->findChildren("cell");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0]->getAttribute("value"), "Y2Fm6Q==");
    EXPECT_EQ(cells[0]->getAttribute("valueEncoding"), "base64");
    EXPECT_EQ(cells[1]->getAttribute("value"), "plain");
    EXPECT_FALSE(cells[1]->hasAttribute("valueEncoding"));
}

TEST_F(DocumentSerializerTest, UnrepresentableTextRoundTrips) {
    const std::string latin1 = "caf\xE9";
    const std::string control = "a\x01" "b\x1b";
    doc.setCell("sheet1", "A1", CellUpdate::literal(latin1));
    doc.setCell("sheet1", "A2", CellUpdate::literal(control));
    doc.setCell("sheet1", "A3", CellUpdate::makeFormula("=SUM(A1,\x02)"));
    doc.renameSheet("sheet1", "bell\x07");
    core::DocumentMetadata metadata = doc.getMetadata();
    metadata.name = "na\xEFve";
    metadata.user_id = "u\x1f";
    doc.setMetadata(metadata);

    core::Document restored = roundTrip(doc);
    EXPECT_EQ(restored.getCell("sheet1", "A1").getValue(), latin1);
    EXPECT_EQ(restored.displayValue("sheet1", "A2"), doc.displayValue("sheet1", "A2"));
    EXPECT_EQ(restored.displayValue("sheet1", "A2"), control);
    EXPECT_EQ(restored.getCell("sheet1", "A3").getFormula(), "=SUM(A1,\x02)");
    EXPECT_EQ(restored.displayValue("sheet1", "A3"), doc.displayValue("sheet1", "A3"));
    EXPECT_EQ(restored.getSheet("sheet1").getName(), "bell\x07");
    EXPECT_EQ(restored.getMetadata().name, "na\xEFve");
    EXPECT_EQ(restored.getMetadata().user_id, "u\x1f");
}

TEST_F(DocumentSerializerTest, BadTextEncodingIsCorrupt) {
    const std::vector<std::string> records = {
        "<document id=\"x\"><data><sheet id=\"s\"><cells>"
        "<cell ref=\"A1\" value=\"@@@\" valueEncoding=\"base64\"/></cells></sheet></data></document>",
        "<document id=\"x\"><data><sheet id=\"s\"><cells>"
        "<cell ref=\"A1\" value=\"abc\" valueEncoding=\"rot13\"/></cells></sheet></data></document>",
        "<document id=\"x\" name=\"YQ\" nameEncoding=\"base64\"><data><sheet id=\"s\"/></data></document>",
        "<document id=\"x\"><data><sheet id=\"s\"><columns>"
        "<entry key=\"A\" value=\"!\" valueEncoding=\"base64\"/></columns></sheet></data></document>",
    };
    for (const auto& record : records) {
        auto parsed = DocumentSerializer::deserialize(record);
        ASSERT_FALSE(parsed.hasValue()) << record;
        EXPECT_EQ(parsed.error().code, core::ErrorCode::FileCorrupted) << record;
    }
}

TEST_F(DocumentSerializerTest, PropertyMapsRoundTrip) {
    core::Sheet sheet("s1", "Data");
    sheet.columns()["A"] = "120";
    sheet.rows()["3"] = "hidden";
    std::vector<core::Sheet> sheets;
    sheets.push_back(sheet);
    core::Document source(std::move(sheets), "s1", doc.getMetadata());

    core::Document restored = roundTrip(source);
    const auto& restored_sheet = restored.getSheet("s1");
    EXPECT_EQ(restored_sheet.columns().at("A"), "120");
    EXPECT_EQ(restored_sheet.rows().at("3"), "hidden");
}

// 缓存结果按原样读入，重算由仓库负责
TEST_F(DocumentSerializerTest, CachedValueIsReadVerbatim) {
    const std::string record = R"xml(<?xml version="1.0" encoding="UTF-8"?>
<document id="x" name="Stale" createdAt="" updatedAt="" userId="1">
  <data activeSheet="sheet1">
    <sheet id="sheet1" name="Sheet1">
      <cells>
        <cell ref="A1" value="5"/>
        <cell ref="A2" formula="=SUM(A1:A1)" cachedValue="42" cachedType="number"/>
      </cells>
    </sheet>
  </data>
</document>)xml";

    auto parsed = DocumentSerializer::deserialize(record);
    ASSERT_TRUE(parsed.hasValue()) << parsed.error().fullMessage();
    EXPECT_EQ(parsed->displayValue("sheet1", "A2"), "42");
    parsed->recalculateAll();
    EXPECT_EQ(parsed->displayValue("sheet1", "A2"), "5");
}

TEST_F(DocumentSerializerTest, UnknownActiveSheetFallsBackToFirst) {
    const std::string record = R"(<document id="x"><data activeSheet="gone"><sheet id="s9" name="Only"/></data></document>)";
    auto parsed = DocumentSerializer::deserialize(record);
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed->getActiveSheetId(), "s9");
}

TEST_F(DocumentSerializerTest, CorruptRecordsAreRejected) {
    const std::vector<std::string> records = {
        "",
        "not xml at all",
        "<document id=\"x\"><data>",
        "<workbook id=\"x\"><data><sheet id=\"s\"/></data></workbook>",
        "<document><data><sheet id=\"s\"/></data></document>",
        "<document id=\"x\"/>",
        "<document id=\"x\"><data/></document>",
        "<document id=\"x\"><data><sheet name=\"no id\"/></data></document>",
        "<document id=\"x\"><data><sheet id=\"s\"><cells><cell value=\"1\"/></cells></sheet></data></document>",
        "<document id=\"x\"><data><sheet id=\"s\"><cells><cell ref=\"1A\" value=\"1\"/></cells></sheet></data></document>",
        "<document id=\"x\"><data><sheet id=\"s\"/><sheet id=\"s\"/></data></document>",
    };
    for (const auto& record : records) {
        auto parsed = DocumentSerializer::deserialize(record);
        ASSERT_FALSE(parsed.hasValue()) << record;
        EXPECT_EQ(parsed.error().code, core::ErrorCode::FileCorrupted) << record;
    }
}
