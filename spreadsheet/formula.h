#pragma once

#include "common.h"

#include <memory>
#include <vector>

// A parsed formula, the part of the cell text after '='
class FormulaInterface {
public:
    virtual ~FormulaInterface() = default;

    // Cell values are requested from resolve; errors are returned, not thrown
    virtual FormulaValue Evaluate(const CellResolver& resolve) const = 0;

    // Canonical text of the expression, without the leading '='
    virtual std::string GetExpression() const = 0;

    virtual std::vector<Position> GetReferencedCells() const = 0;
};

// Throws FormulaException if the expression is malformed
std::unique_ptr<FormulaInterface> ParseFormula(std::string expression);
