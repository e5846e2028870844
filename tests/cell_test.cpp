#include "tests/test_common.h"

#include "cell.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

namespace {

template <typename T>
bool Holds(const CellContent& content) {
    return std::holds_alternative<T>(content);
}

using FormulaPtr = std::shared_ptr<const FormulaInterface>;

}  // namespace

TEST(CellContentTest, Numbers) {
    const std::pair<const char*, double> cases[] = {
        {"12", 12.0}, {"-3.5", -3.5}, {"+7", 7.0}, {"1e3", 1000.0}, {"0.50", 0.5},
    };
    for (const auto& [text, expected] : cases) {
        auto content = ParseCellContent(text);
        ASSERT_TRUE(Holds<double>(content)) << text;
        EXPECT_DOUBLE_EQ(std::get<double>(content), expected) << text;
    }
}

TEST(CellContentTest, TextIsKeptAsTyped) {
    for (const char* text : {"hello", "12abc", " 5", "5 ", "1,5", "A1", "nan", "-"}) {
        auto content = ParseCellContent(text);
        ASSERT_TRUE(Holds<std::string>(content)) << text;
        EXPECT_EQ(std::get<std::string>(content), text);
    }
}

TEST(CellContentTest, EscapeSignMakesText) {
    auto content = ParseCellContent("'42");
    ASSERT_TRUE(Holds<std::string>(content));
    EXPECT_EQ(std::get<std::string>(content), "42");

    content = ParseCellContent("'=1+2");
    ASSERT_TRUE(Holds<std::string>(content));
    EXPECT_EQ(std::get<std::string>(content), "=1+2");
}

TEST(CellContentTest, Formula) {
    auto content = ParseCellContent("=A1 + 2");
    ASSERT_TRUE(Holds<FormulaPtr>(content));
    EXPECT_EQ(std::get<FormulaPtr>(content)->GetExpression(), "A1+2");
}

TEST(CellContentTest, MalformedFormulaIsParseFailure) {
    for (const char* text : {"=", "=1+", "=(A1", "=A1 B1", "=hello"}) {
        auto content = ParseCellContent(text);
        ASSERT_TRUE(Holds<ParseFailure>(content)) << text;
        EXPECT_FALSE(std::get<ParseFailure>(content).message.empty());
    }
}

TEST(CellTest, KeepsRawText) {
    Cell cell("=  a1 +2");
    EXPECT_EQ(cell.GetText(), "=  a1 +2");
    EXPECT_TRUE(Holds<FormulaPtr>(cell.GetContent()));
}

TEST(CellTest, ReferencedCells) {
    EXPECT_EQ(Cell("=B1+A1*B1").GetReferencedCells(), (std::vector<Position>{"A1"_pos, "B1"_pos}));
    EXPECT_TRUE(Cell("12").GetReferencedCells().empty());
    EXPECT_TRUE(Cell("'=A1").GetReferencedCells().empty());
    EXPECT_TRUE(Cell("=A1+").GetReferencedCells().empty());
}
