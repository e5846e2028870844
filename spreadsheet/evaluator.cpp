#include "evaluator.h"

#include "formula.h"

#include <cassert>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// Values computed during one top-level evaluation, each cell at most once
using ValueMap = std::unordered_map<Position, CellInterface::Value, Position::Hasher>;
// Cells whose formulas are being evaluated on the current chain
using InProgressSet = std::unordered_set<Position, Position::Hasher>;

const FormulaInterface* GetFormula(const CellInterface* cell) {
    if (!cell) {
        return nullptr;
    }
    const auto* formula = std::get_if<std::shared_ptr<const FormulaInterface>>(&cell->GetContent());
    return formula ? formula->get() : nullptr;
}

// Value of a cell that is not a formula
CellInterface::Value GetLiteralValue(const CellInterface* cell) {
    if (!cell) {
        return std::monostate{};
    }
    return std::visit([](const auto& content) -> CellInterface::Value {
        using T = std::decay_t<decltype(content)>;
        if constexpr (std::is_same_v<T, ParseFailure>) {
            return FormulaError(FormulaError::Category::Parse);
        } else if constexpr (std::is_same_v<T, std::shared_ptr<const FormulaInterface>>) {
            assert(false);
            return std::monostate{};
        } else {
            return content;
        }
    }, cell->GetContent());
}

// Value of an already evaluated cell as an operand of an arithmetic expression
FormulaValue ToOperand(const CellInterface::Value& value) {
    return std::visit([](const auto& x) -> FormulaValue {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0.0;
        } else if constexpr (std::is_same_v<T, std::string>) {
            return FormulaError(FormulaError::Category::TypeMismatch);
        } else {
            return x;
        }
    }, value);
}

CellInterface::Value ToCellValue(const FormulaValue& result) {
    if (std::holds_alternative<double>(result)) {
        return std::get<double>(result);
    }
    return std::get<FormulaError>(result);
}

struct Frame {
    Position pos;
    bool expanded = false;
};

// Depth-first over the references with an explicit stack: a formula is
// expanded first, pushing the cells it needs, and computed once they are
// all known. A reference to a cell still in progress is a cycle.
CellInterface::Value Evaluate(Position root, const SheetInterface& sheet) {
    ValueMap values;
    InProgressSet in_progress;
    std::vector<Frame> stack{{root}};

    while (!stack.empty()) {
        Frame& frame = stack.back();
        Position pos = frame.pos;
        if (values.count(pos)) {
            stack.pop_back();
            continue;
        }

        const CellInterface* cell = sheet.GetCell(pos);
        const FormulaInterface* formula = GetFormula(cell);
        if (!formula) {
            values.emplace(pos, GetLiteralValue(cell));
            stack.pop_back();
            continue;
        }

        if (!frame.expanded) {
            frame.expanded = true;
            in_progress.insert(pos);
            for (Position ref : formula->GetReferencedCells()) {
                if (!values.count(ref) && !in_progress.count(ref)) {
                    stack.push_back({ref});
                }
            }
            continue;
        }

        auto result = formula->Evaluate([&values, &in_progress](Position ref) -> FormulaValue {
            if (in_progress.count(ref)) {
                spdlog::trace("circular reference through {}", ref.ToString());
                return FormulaError(FormulaError::Category::Cycle);
            }
            return ToOperand(values.at(ref));
        });
        in_progress.erase(pos);
        values.emplace(pos, ToCellValue(result));
        stack.pop_back();
    }

    return values.at(root);
}

std::string FormatNumber(double value) {
    if (value == 0) {
        value = 0;  // drops the sign of -0
    }
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

}  // namespace

CellInterface::Value EvaluateCell(Position pos, const SheetInterface& sheet) {
    return Evaluate(pos, sheet);
}

std::string FormatValue(const CellInterface::Value& value) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "";
        } else if constexpr (std::is_same_v<T, double>) {
            return FormatNumber(x);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return x;
        } else {
            return std::string(x.ToString());
        }
    }, value);
}
