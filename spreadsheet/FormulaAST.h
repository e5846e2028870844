#pragma once

#include "common.h"

#include <iosfwd>
#include <memory>
#include <set>
#include <stdexcept>
#include <vector>

namespace ASTImpl {
struct Expr;
}

class ParsingError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

class FormulaAST {
public:
    explicit FormulaAST(std::unique_ptr<ASTImpl::Expr> root_expr, const std::set<Position>& cells = {});

    FormulaAST(FormulaAST&&) = default;
    FormulaAST& operator=(FormulaAST&&) = default;
    ~FormulaAST();

    // Evaluates left operand before right and stops at the first error
    FormulaValue Execute(const CellResolver& resolve) const;

    // Prefix form, e.g. (+ A1 (* 2 B1))
    void Print(std::ostream& out) const;
    // Infix form with only the parentheses the tree needs
    void PrintFormula(std::ostream& out) const;

    std::vector<Position> GetReferencedCells() const;

private:
    std::unique_ptr<ASTImpl::Expr> root_expr_;
    std::vector<Position> cells_;
};

FormulaAST ParseFormulaAST(std::istream& in);
FormulaAST ParseFormulaAST(const std::string& in_str);
