#include <gtest/gtest.h>
#include "sheetdrive/core/Document.hpp"
#include "sheetdrive/core/Exception.hpp"

using namespace sheetdrive::core;

class DocumentTest : public ::testing::Test {
protected:
    Document doc;
};

TEST_F(DocumentTest, NewDocumentHasOneCleanSheet) {
    ASSERT_EQ(doc.getSheetCount(), 1u);
    EXPECT_EQ(doc.listSheets().front(), (SheetInfo{"sheet1", "Sheet1"}));
    EXPECT_EQ(doc.getActiveSheetId(), "sheet1");
    EXPECT_FALSE(doc.isDirty());
    EXPECT_TRUE(doc.getMetadata().id.empty());
}

TEST_F(DocumentTest, SetCellMarksDirtyAndEvaluates) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("5"));
    doc.setCell("sheet1", "A2", CellUpdate::makeFormula("=SUM(A1:A1)"));
    EXPECT_TRUE(doc.isDirty());
    EXPECT_EQ(doc.displayValue("sheet1", "A1"), "5");
    EXPECT_EQ(doc.displayValue("sheet1", "A2"), "5");
    EXPECT_EQ(doc.editText("sheet1", "A2"), "=SUM(A1:A1)");
    EXPECT_EQ(doc.displayValue("sheet1", "Z99"), "");
}

// 修改被引用的字面值会刷新公式
TEST_F(DocumentTest, EditingReferencedLiteralRefreshesFormula) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("1"));
    doc.setCell("sheet1", "A2", CellUpdate::literal("2"));
    doc.setCell("sheet1", "B1", CellUpdate::makeFormula("=SUM(A1:A2)"));
    EXPECT_EQ(doc.displayValue("sheet1", "B1"), "3");

    doc.setCell("sheet1", "A2", CellUpdate::literal("10"));
    EXPECT_EQ(doc.displayValue("sheet1", "B1"), "11");

    doc.setCell("sheet1", "A1", CellUpdate::clearAll());
    EXPECT_EQ(doc.displayValue("sheet1", "B1"), "10");
}

TEST_F(DocumentTest, FormulaReplacedByLiteralShowsOnlyLiteral) {
    doc.setCell("sheet1", "A1", CellUpdate::makeFormula("=SUM(B1)"));
    doc.setCell("sheet1", "A1", CellUpdate::literal("plain"));
    EXPECT_EQ(doc.displayValue("sheet1", "A1"), "plain");
    EXPECT_EQ(doc.editText("sheet1", "A1"), "plain");
    EXPECT_TRUE(doc.getCell("sheet1", "A1").getFormula().empty());
}

TEST_F(DocumentTest, SetCellRejectsBadInput) {
    EXPECT_THROW(doc.setCell("nope", "A1", CellUpdate::literal("1")), SheetNotFoundException);
    EXPECT_THROW(doc.setCell("sheet1", "1A", CellUpdate::literal("1")), AddressParseException);
    EXPECT_THROW(doc.displayValue("nope", "A1"), SheetNotFoundException);
    EXPECT_FALSE(doc.isDirty());
}

TEST_F(DocumentTest, FormulasOnlySeeTheirOwnSheet) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("7"));
    std::string second = doc.addSheet();
    doc.setCell(second, "B1", CellUpdate::makeFormula("=SUM(A1:A1)"));
    EXPECT_EQ(doc.displayValue(second, "B1"), "0");
}

TEST_F(DocumentTest, AddSheetActivatesNewSheet) {
    EXPECT_EQ(doc.addSheet(), "sheet2");
    EXPECT_EQ(doc.getActiveSheetId(), "sheet2");
    EXPECT_TRUE(doc.isDirty());
    EXPECT_EQ(doc.listSheets().back(), (SheetInfo{"sheet2", "Sheet2"}));
}

TEST_F(DocumentTest, AddSheetAfterRemovingMiddleNeverDuplicates) {
    doc.addSheet();  // sheet2
    doc.addSheet();  // sheet3
    doc.removeSheet("sheet2");
    std::string id = doc.addSheet();
    EXPECT_NE(id, "sheet3");
    EXPECT_EQ(id, "sheet4");

    auto sheets = doc.listSheets();
    ASSERT_EQ(sheets.size(), 3u);
    EXPECT_EQ(sheets[0].id, "sheet1");
    EXPECT_EQ(sheets[1].id, "sheet3");
    EXPECT_EQ(sheets[2].id, "sheet4");
}

TEST_F(DocumentTest, RemovingOnlySheetIsNoOp) {
    doc.removeSheet("sheet1");
    EXPECT_EQ(doc.getSheetCount(), 1u);
    EXPECT_EQ(doc.getActiveSheetId(), "sheet1");
    EXPECT_FALSE(doc.isDirty());
}

TEST_F(DocumentTest, RemovingActiveSheetActivatesFirst) {
    doc.addSheet();
    doc.addSheet();
    ASSERT_EQ(doc.getActiveSheetId(), "sheet3");
    doc.removeSheet("sheet3");
    EXPECT_EQ(doc.getActiveSheetId(), "sheet1");
    EXPECT_FALSE(doc.hasSheet("sheet3"));

    EXPECT_THROW(doc.removeSheet("sheet3"), SheetNotFoundException);
}

TEST_F(DocumentTest, RenameSheet) {
    doc.renameSheet("sheet1", "Budget");
    EXPECT_EQ(doc.getSheet("sheet1").getName(), "Budget");
    EXPECT_TRUE(doc.isDirty());
    EXPECT_THROW(doc.renameSheet("sheet9", "X"), SheetNotFoundException);
}

TEST_F(DocumentTest, SetActiveSheetDoesNotDirty) {
    doc.addSheet();
    doc.markClean();

    EXPECT_TRUE(doc.setActiveSheet("sheet1").isOk());
    EXPECT_EQ(doc.getActiveSheetId(), "sheet1");
    EXPECT_FALSE(doc.isDirty());

    Error error = doc.setActiveSheet("nope");
    EXPECT_TRUE(error.isError());
    EXPECT_EQ(error.code, ErrorCode::SheetNotFound);
    EXPECT_EQ(doc.getActiveSheetId(), "sheet1");
    EXPECT_FALSE(doc.isDirty());
}

TEST_F(DocumentTest, SnapshotGrid) {
    doc.setCell("sheet1", "A1", CellUpdate::literal("x"));
    doc.setCell("sheet1", "B2", CellUpdate::literal("2"));
    doc.setCell("sheet1", "C1", CellUpdate::makeFormula("=SUM(B2:B2)"));

    GridSnapshot grid = doc.snapshotGrid("sheet1", 2, 3);
    EXPECT_EQ(grid.column_headers, (std::vector<std::string>{"A", "B", "C"}));
    ASSERT_EQ(grid.rowCount(), 2u);
    EXPECT_EQ(grid.rows[0], (std::vector<std::string>{"x", "", "2"}));
    EXPECT_EQ(grid.rows[1], (std::vector<std::string>{"", "2", ""}));

    EXPECT_EQ(doc.snapshotGrid("sheet1", 0, 0).rowCount(), 0u);
}

TEST_F(DocumentTest, ConstructFromSheets) {
    std::vector<Sheet> sheets;
    sheets.emplace_back("a", "Alpha");
    sheets.emplace_back("b", "Beta");
    Document restored(std::move(sheets), "missing", DocumentMetadata{});
    EXPECT_EQ(restored.getActiveSheetId(), "a");
    EXPECT_FALSE(restored.isDirty());

    EXPECT_THROW(Document(std::vector<Sheet>{}, "a", DocumentMetadata{}), OperationException);

    std::vector<Sheet> duplicated;
    duplicated.emplace_back("a", "One");
    duplicated.emplace_back("a", "Two");
    EXPECT_THROW(Document(std::move(duplicated), "a", DocumentMetadata{}), OperationException);
}

TEST_F(DocumentTest, RecalculateAllUsesPrefix) {
    doc.setFormulaPrefix('#');
    doc.setCell("sheet1", "A1", CellUpdate::literal("2"));
    doc.setCell("sheet1", "A2", CellUpdate::makeFormula("#SUM(A1:A1)"));
    EXPECT_EQ(doc.displayValue("sheet1", "A2"), "2");

    doc.recalculateAll();
    EXPECT_EQ(doc.displayValue("sheet1", "A2"), "2");
}
