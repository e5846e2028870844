#include "formula.h"

#include "FormulaAST.h"

#include <sstream>

namespace {
class Formula : public FormulaInterface {
public:
    explicit Formula(std::string expression);
    FormulaValue Evaluate(const CellResolver& resolve) const override;
    std::string GetExpression() const override;
    std::vector<Position> GetReferencedCells() const override;

private:
    FormulaAST ast_;
};

Formula::Formula(std::string expression)
    : ast_(ParseFormulaAST(std::move(expression))) {
}

FormulaValue Formula::Evaluate(const CellResolver& resolve) const {
    return ast_.Execute(resolve);
}

std::string Formula::GetExpression() const {
    std::ostringstream out;
    ast_.PrintFormula(out);
    return out.str();
}

std::vector<Position> Formula::GetReferencedCells() const {
    return ast_.GetReferencedCells();
}

}  // namespace

std::unique_ptr<FormulaInterface> ParseFormula(std::string expression) {
    return std::make_unique<Formula>(std::move(expression));
}
