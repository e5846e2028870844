#pragma once

#include "common.h"

#include <string>

// Evaluates the cell at pos, resolving references through sheet.
// Blank cells are std::monostate, text cells their display text;
// every failure, including a circular reference, comes back as FormulaError.
CellInterface::Value EvaluateCell(Position pos, const SheetInterface& sheet);

// Display string: numbers with up to 15 significant digits,
// text verbatim, blank as "", errors as their tag
std::string FormatValue(const CellInterface::Value& value);
