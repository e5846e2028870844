#include "cell.h"

#include <cassert>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::optional<double> ParseNumber(std::string_view text) {
    double value = 0;
    std::istringstream in{std::string(text)};
    in >> std::noskipws >> value;
    if (!in || in.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

CellContent ParseCellContent(std::string_view text) {
    if (!text.empty() && text[0] == FORMULA_SIGN) {
        try {
            return std::shared_ptr<const FormulaInterface>(ParseFormula(std::string(text.substr(1))));
        } catch (const FormulaException& fe) {
            spdlog::debug("cannot parse formula '{}': {}", text, fe.what());
            return ParseFailure{fe.what()};
        }
    }
    if (!text.empty() && text[0] == ESCAPE_SIGN) {
        return std::string(text.substr(1));
    }
    if (auto number = ParseNumber(text)) {
        return *number;
    }
    return std::string(text);
}

Cell::Cell(std::string text)
    : text_(std::move(text))
    , content_(ParseCellContent(text_)) {
    assert(!text_.empty());
}

std::string Cell::GetText() const {
    return text_;
}

const CellContent& Cell::GetContent() const {
    return content_;
}

std::vector<Position> Cell::GetReferencedCells() const {
    if (const auto* formula = std::get_if<std::shared_ptr<const FormulaInterface>>(&content_)) {
        return (*formula)->GetReferencedCells();
    }
    return {};
}
