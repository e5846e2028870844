#include "tests/test_common.h"

#include "sheet.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

static_assert(!std::is_copy_constructible_v<Sheet>);
static_assert(!std::is_copy_assignable_v<Sheet>);

class SheetTest : public ::testing::Test {
protected:
    std::unique_ptr<SheetInterface> sheet = CreateSheet();
};

TEST_F(SheetTest, EmptySheet) {
    EXPECT_EQ(sheet->GetCell("A1"_pos), nullptr);
    EXPECT_EQ(sheet->GetText("C4"_pos), "");
    EXPECT_EQ(sheet->Render("C4"_pos), "");
    EXPECT_EQ(sheet->GetPrintableSize(), (Size{0, 0}));
}

TEST_F(SheetTest, RawTextRoundTrip) {
    for (const char* text : {"12", "hello", "=1 + 2", "=(1", "'=A1", "= A1*a2 ", "  "}) {
        sheet->SetCell("B2"_pos, text);
        EXPECT_EQ(sheet->GetText("B2"_pos), text);
        ASSERT_NE(sheet->GetCell("B2"_pos), nullptr);
        EXPECT_EQ(sheet->GetCell("B2"_pos)->GetText(), text);
    }
}

TEST_F(SheetTest, EmptyTextRemovesCell) {
    sheet->SetCell("A1"_pos, "5");
    sheet->SetCell("C3"_pos, "=A1");
    sheet->SetCell("C3"_pos, "");

    EXPECT_EQ(sheet->GetCell("C3"_pos), nullptr);
    EXPECT_EQ(sheet->GetText("C3"_pos), "");
    EXPECT_EQ(sheet->Render("C3"_pos), "");
    EXPECT_EQ(sheet->GetPrintableSize(), (Size{1, 1}));

    sheet->ClearCell("A1"_pos);
    sheet->ClearCell("A1"_pos);
    EXPECT_EQ(sheet->GetPrintableSize(), (Size{0, 0}));
}

TEST_F(SheetTest, RendersNumberLiteralsCanonically) {
    const std::pair<const char*, const char*> cases[] = {
        {"5", "5"}, {"5.0", "5"}, {"0.50", "0.5"}, {"-12.25", "-12.25"}, {"1e3", "1000"}, {"007", "7"},
    };
    for (const auto& [text, expected] : cases) {
        sheet->SetCell("A1"_pos, text);
        EXPECT_EQ(sheet->Render("A1"_pos), expected) << text;
    }
}

TEST_F(SheetTest, RendersTextVerbatim) {
    sheet->SetCell("A1"_pos, "Total:");
    sheet->SetCell("A2"_pos, "'123");
    EXPECT_EQ(sheet->Render("A1"_pos), "Total:");
    EXPECT_EQ(sheet->Render("A2"_pos), "123");
    EXPECT_EQ(sheet->GetText("A2"_pos), "'123");
}

TEST_F(SheetTest, Precedence) {
    sheet->SetCell("A1"_pos, "2");
    sheet->SetCell("B1"_pos, "3");
    sheet->SetCell("C1"_pos, "4");
    sheet->SetCell("D1"_pos, "=A1+B1*C1");
    EXPECT_EQ(sheet->Render("D1"_pos), "14");
}

TEST_F(SheetTest, ChainedReferencesFollowEdits) {
    sheet->SetCell("A1"_pos, "5");
    sheet->SetCell("B1"_pos, "=A1+1");
    sheet->SetCell("C1"_pos, "=B1*2");
    EXPECT_EQ(sheet->Render("C1"_pos), "12");

    sheet->SetCell("A1"_pos, "10");
    EXPECT_EQ(sheet->Render("C1"_pos), "22");

    sheet->ClearCell("A1"_pos);
    EXPECT_EQ(sheet->Render("C1"_pos), "2");
}

TEST_F(SheetTest, ErrorTags) {
    sheet->SetCell("A1"_pos, "=A1");
    sheet->SetCell("A2"_pos, "10");
    sheet->SetCell("B2"_pos, "0");
    sheet->SetCell("C2"_pos, "=A2/B2");
    sheet->SetCell("A3"_pos, "=1+*2");
    sheet->SetCell("A4"_pos, "word");
    sheet->SetCell("B4"_pos, "=A4");
    sheet->SetCell("A5"_pos, "=AA5");

    EXPECT_EQ(sheet->Render("A1"_pos), "#CYCLE!");
    EXPECT_EQ(sheet->Render("C2"_pos), "#DIV/0!");
    EXPECT_EQ(sheet->Render("A3"_pos), "#PARSE!");
    EXPECT_EQ(sheet->Render("B4"_pos), "#VALUE!");
    EXPECT_EQ(sheet->Render("A5"_pos), "#REF!");
}

TEST_F(SheetTest, GetValue) {
    sheet->SetCell("A1"_pos, "=1/4");
    EXPECT_EQ(sheet->GetValue("A1"_pos), CellInterface::Value(0.25));
    EXPECT_EQ(sheet->GetValue("A2"_pos), CellInterface::Value(std::monostate{}));

    std::ostringstream out;
    out << sheet->GetValue("A1"_pos);
    EXPECT_EQ(out.str(), "0.25");
}

TEST_F(SheetTest, WriteAtNonPositivePositionThrows) {
    EXPECT_THROW(sheet->SetCell(Position{0, 1}, "1"), InvalidPositionException);
    EXPECT_THROW(sheet->SetCell(Position{1, -1}, "1"), InvalidPositionException);
    EXPECT_THROW(sheet->ClearCell(Position::NONE), InvalidPositionException);
}

TEST_F(SheetTest, ReadsNeverThrow) {
    for (Position pos : {Position{16385, 1}, Position{20000, 3}, Position{1, 40}, Position::NONE, Position{0, 0}}) {
        EXPECT_NO_THROW({
            EXPECT_EQ(sheet->GetCell(pos), nullptr);
            EXPECT_EQ(sheet->GetText(pos), "");
            EXPECT_EQ(sheet->Render(pos), "");
        });
    }
}

TEST_F(SheetTest, GridSizeIsUpToTheCaller) {
    sheet->SetCell(Position{20000, 3}, "7");
    sheet->SetCell(Position{1, 30}, "wide");
    sheet->SetCell("A1"_pos, "=C20000*2+A16385");
    EXPECT_EQ(sheet->GetText(Position{20000, 3}), "7");
    EXPECT_EQ(sheet->Render(Position{1, 30}), "wide");
    EXPECT_EQ(sheet->Render("A1"_pos), "14");
}

TEST_F(SheetTest, LongReferenceChain) {
    const int length = 20000;
    for (int row = 1; row < length; ++row) {
        sheet->SetCell(Position{row, 1}, "=A" + std::to_string(row + 1) + "+1");
    }
    sheet->SetCell(Position{length, 1}, "1");
    EXPECT_EQ(sheet->Render("A1"_pos), std::to_string(length));

    sheet->SetCell(Position{length, 1}, "=A1");
    EXPECT_EQ(sheet->Render("A1"_pos), "#CYCLE!");
    EXPECT_EQ(sheet->Render(Position{length / 2, 1}), "#CYCLE!");
}

TEST_F(SheetTest, PrintableArea) {
    sheet->SetCell("A1"_pos, "=1/2");
    sheet->SetCell("B2"_pos, "text");
    sheet->SetCell("A3"_pos, "'=x");
    EXPECT_EQ(sheet->GetPrintableSize(), (Size{3, 2}));

    std::ostringstream values;
    sheet->PrintValues(values);
    EXPECT_EQ(values.str(), "0.5\t\n\ttext\n=x\t\n");

    std::ostringstream texts;
    sheet->PrintTexts(texts);
    EXPECT_EQ(texts.str(), "=1/2\t\n\ttext\n'=x\t\n");
}
