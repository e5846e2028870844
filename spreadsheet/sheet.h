#pragma once

#include "cell.h"
#include "common.h"

#include <unordered_map>

// Owns every cell of the sheet; a cell exists only while its text is non-empty.
// Values are not cached, each read evaluates the formulas it needs.
class Sheet : public SheetInterface {
public:
    Sheet();
    ~Sheet();

    Sheet(const Sheet&) = delete;
    Sheet& operator=(const Sheet&) = delete;

    void SetCell(Position pos, std::string text) override;

    const CellInterface* GetCell(Position pos) const override;

    void ClearCell(Position pos) override;

    std::string GetText(Position pos) const override;
    CellInterface::Value GetValue(Position pos) const override;
    std::string Render(Position pos) const override;

    Size GetPrintableSize() const override;

    void PrintValues(std::ostream& output) const override;
    void PrintTexts(std::ostream& output) const override;

    // Throws InvalidPositionException for non-positive coordinates
    static void ValidatePosition(Position pos);

private:
    std::unordered_map<Position, Cell, Position::Hasher> table_;

    template <typename CellPrinter>
    void PrintCells(std::ostream& output, const CellPrinter& print_cell) const;
};

std::ostream& operator<<(std::ostream& out, const CellInterface::Value& value);
