#pragma once

#include "common.h"
#include "formula.h"

#include <string_view>

// Interprets raw cell text:
//   "=..."  formula, or ParseFailure if the expression is malformed
//   "'..."  text without the escape sign
//   a number in full, e.g. "12", "-3.5", "1e3"
//   anything else is text as typed
// Never throws on malformed input.
CellContent ParseCellContent(std::string_view text);

// Non-empty raw text together with its parsed interpretation
class Cell : public CellInterface {
public:
    explicit Cell(std::string text);

    std::string GetText() const override;
    const CellContent& GetContent() const override;
    std::vector<Position> GetReferencedCells() const override;

private:
    std::string text_;
    CellContent content_;
};
