#include "sheet.h"

#include "cell.h"
#include "common.h"
#include "evaluator.h"

#include <algorithm>
#include <iostream>

#include <spdlog/spdlog.h>

Sheet::Sheet() = default;

Sheet::~Sheet() = default;

void Sheet::SetCell(Position pos, std::string text) {
    ValidatePosition(pos);
    if (text.empty()) {
        ClearCell(pos);
        return;
    }
    auto it = table_.find(pos);
    if (it != table_.end() && it->second.GetText() == text) {
        return;
    }
    spdlog::debug("set {}:{} to '{}'", pos.row, pos.col, text);
    table_.insert_or_assign(pos, Cell(std::move(text)));
}

const CellInterface* Sheet::GetCell(Position pos) const {
    auto it = table_.find(pos);
    if (it != table_.end()) {
        return &it->second;
    }
    return nullptr;
}

void Sheet::ClearCell(Position pos) {
    ValidatePosition(pos);
    if (table_.erase(pos)) {
        spdlog::debug("cleared {}:{}", pos.row, pos.col);
    }
}

std::string Sheet::GetText(Position pos) const {
    const CellInterface* cell = GetCell(pos);
    return cell ? cell->GetText() : std::string();
}

CellInterface::Value Sheet::GetValue(Position pos) const {
    return EvaluateCell(pos, *this);
}

std::string Sheet::Render(Position pos) const {
    return FormatValue(GetValue(pos));
}

Size Sheet::GetPrintableSize() const {
    Size size;
    for (const auto& [pos, _] : table_) {
        size.rows = std::max(pos.row, size.rows);
        size.cols = std::max(pos.col, size.cols);
    }
    return size;
}

template <typename CellPrinter>
void Sheet::PrintCells(std::ostream& output, const CellPrinter& print_cell) const {
    auto size = GetPrintableSize();
    for (int row = 1; row <= size.rows; ++row) {
        for (int col = 1; col <= size.cols; ++col) {
            if (table_.count({row, col})) {
                print_cell(Position{row, col});
            }
            if (col != size.cols) {
                output << '\t';
            }
        }
        output << '\n';
    }
}

void Sheet::PrintValues(std::ostream& output) const {
    PrintCells(output, [&](Position pos) {
        output << Render(pos);
    });
}

void Sheet::PrintTexts(std::ostream& output) const {
    PrintCells(output, [&](Position pos) {
        output << table_.at(pos).GetText();
    });
}

void Sheet::ValidatePosition(Position pos) {
    if (!pos.IsValid()) {
        throw InvalidPositionException("Invalid position " + std::to_string(pos.row) + ":" +
                                       std::to_string(pos.col));
    }
}

std::unique_ptr<SheetInterface> CreateSheet() {
    return std::make_unique<Sheet>();
}

std::ostream& operator<<(std::ostream& output, const CellInterface::Value& value) {
    return output << FormatValue(value);
}
