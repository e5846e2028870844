#include "common.h"

#include <algorithm>
#include <cctype>
#include <climits>
#include <ostream>
#include <tuple>

const int LETTERS = 26;
const int MAX_POSITION_LENGTH = 11;

const Position Position::NONE = {-1, -1};

bool Position::operator==(const Position rhs) const {
    return row == rhs.row && col == rhs.col;
}

bool Position::operator!=(const Position rhs) const {
    return !(*this == rhs);
}

bool Position::operator<(const Position rhs) const {
    return std::tie(row, col) < std::tie(rhs.row, rhs.col);
}

bool Position::IsValid() const {
    return row >= 1 && col >= 1;
}

std::string Position::ToString() const {
    if (!IsValid() || col > MAX_COLS) {
        return "";
    }
    return static_cast<char>('A' + col - 1) + std::to_string(row);
}

// A single column letter followed by a row number without leading zeros
Position Position::FromString(std::string_view str) {
    if (str.size() < 2 || str.size() > MAX_POSITION_LENGTH) {
        return NONE;
    }
    if (!std::isalpha(static_cast<unsigned char>(str[0]))) {
        return NONE;
    }
    auto digits = str.substr(1);
    if (digits[0] == '0') {
        return NONE;
    }
    long long row = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return NONE;
        }
        row = row * 10 + (c - '0');
    }
    if (row > INT_MAX) {
        return NONE;
    }

    Position result{static_cast<int>(row), std::toupper(static_cast<unsigned char>(str[0])) - 'A' + 1};
    if (result.col < 1 || result.col > LETTERS) {
        return NONE;
    }
    return result;
}

size_t Position::Hasher::operator()(Position pos) const {
    return std::hash<int>()(pos.row) * 37 + std::hash<int>()(pos.col);
}

bool Size::operator==(Size rhs) const {
    return rows == rhs.rows && cols == rhs.cols;
}

Position Next(Direction direction, Position pos) {
    return Next(direction, pos, Size{INT_MAX, INT_MAX});
}

Position Next(Direction direction, Position pos, Size bounds) {
    int rows = std::max(bounds.rows, 1);
    int cols = std::max(bounds.cols, 1);
    pos.row = std::clamp(pos.row, 1, rows);
    pos.col = std::clamp(pos.col, 1, cols);
    switch (direction) {
        case Direction::Up:
            if (pos.row > 1) {
                --pos.row;
            }
            break;
        case Direction::Down:
            if (pos.row < rows) {
                ++pos.row;
            }
            break;
        case Direction::Left:
            if (pos.col > 1) {
                --pos.col;
            }
            break;
        case Direction::Right:
            if (pos.col < cols) {
                ++pos.col;
            }
            break;
    }
    return pos;
}

FormulaError::FormulaError(Category category)
    : category_(category) {
}

FormulaError::Category FormulaError::GetCategory() const {
    return category_;
}

bool FormulaError::operator==(FormulaError rhs) const {
    return category_ == rhs.category_;
}

bool FormulaError::operator!=(FormulaError rhs) const {
    return !(*this == rhs);
}

std::string_view FormulaError::ToString() const {
    switch (category_) {
        case Category::Parse:
            return "#PARSE!";
        case Category::Cycle:
            return "#CYCLE!";
        case Category::TypeMismatch:
            return "#VALUE!";
        case Category::Div0:
            return "#DIV/0!";
        case Category::Ref:
            return "#REF!";
        case Category::Arithmetic:
            return "#ARITHM!";
    }
    return "";
}

std::ostream& operator<<(std::ostream& output, FormulaError fe) {
    return output << fe.ToString();
}

std::ostream& operator<<(std::ostream& output, FormulaError::Category fe_category) {
    return output << FormulaError(fe_category);
}
