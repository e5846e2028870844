#pragma once

#include <functional>
#include <iosfwd>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Cell address, both coordinates are 1-based ("A1" is {1, 1})
struct Position {
    int row = 0;
    int col = 0;

    bool operator==(Position rhs) const;
    bool operator!=(Position rhs) const;
    bool operator<(Position rhs) const;

    // Both coordinates positive; the grid size belongs to the caller
    bool IsValid() const;
    // "" for positions without a name, i.e. columns past 'Z'
    std::string ToString() const;

    static Position FromString(std::string_view str);

    struct Hasher {
        size_t operator()(Position pos) const;
    };

    // Columns that have a single-letter name
    static constexpr int MAX_COLS = 26;
    static const Position NONE;
};

struct Size {
    int rows = 0;
    int cols = 0;

    bool operator==(Size rhs) const;
};

enum class Direction {
    Up,
    Down,
    Left,
    Right,
};

// Moves one step, never below row or column 1
Position Next(Direction direction, Position pos);
// Moves one step, clamped to [1, bounds.rows] x [1, bounds.cols]
Position Next(Direction direction, Position pos, Size bounds);

// Evaluation error, stored as a value and shown in place of the cell's result
class FormulaError {
public:
    enum class Category {
        Parse,         // malformed formula
        Cycle,         // the cell is reached again while it is being evaluated
        TypeMismatch,  // text used where a number is required
        Div0,          // division by zero
        Ref,           // reference to a position that cannot exist
        Arithmetic,    // non-finite result
    };

    FormulaError(Category category);

    Category GetCategory() const;

    bool operator==(FormulaError rhs) const;
    bool operator!=(FormulaError rhs) const;

    std::string_view ToString() const;

private:
    Category category_;
};

std::ostream& operator<<(std::ostream& output, FormulaError fe);
std::ostream& operator<<(std::ostream& output, FormulaError::Category fe_category);

// Outcome of evaluating a formula
using FormulaValue = std::variant<double, FormulaError>;

// Supplies the numeric value of a referenced cell during evaluation
using CellResolver = std::function<FormulaValue(Position)>;

// Thrown when a cell is written at a non-positive position
class InvalidPositionException : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

// Thrown by ParseFormula on malformed input
class FormulaException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FormulaInterface;

// Result of parsing a cell's raw text: a number, display text,
// a formula, or the reason the formula could not be parsed
struct ParseFailure {
    std::string message;
};

using CellContent = std::variant<double, std::string, std::shared_ptr<const FormulaInterface>, ParseFailure>;

class CellInterface {
public:
    // std::monostate is a blank cell
    using Value = std::variant<std::monostate, double, std::string, FormulaError>;

    virtual ~CellInterface() = default;

    // Text exactly as it was entered
    virtual std::string GetText() const = 0;

    virtual const CellContent& GetContent() const = 0;

    // Cells the formula refers to, sorted and without duplicates;
    // empty for anything but a formula
    virtual std::vector<Position> GetReferencedCells() const = 0;
};

inline constexpr char FORMULA_SIGN = '=';
inline constexpr char ESCAPE_SIGN = '\'';

class SheetInterface {
public:
    virtual ~SheetInterface() = default;

    // Stores text at pos; empty text removes the cell.
    // Nothing is evaluated here, formulas are computed on demand.
    virtual void SetCell(Position pos, std::string text) = 0;

    // Reading never throws: any position without a cell is blank
    virtual const CellInterface* GetCell(Position pos) const = 0;

    virtual void ClearCell(Position pos) = 0;

    // Raw text of the cell or an empty string
    virtual std::string GetText(Position pos) const = 0;

    virtual CellInterface::Value GetValue(Position pos) const = 0;

    // Display string of the evaluated cell, never throws on bad formulas
    virtual std::string Render(Position pos) const = 0;

    virtual Size GetPrintableSize() const = 0;

    virtual void PrintValues(std::ostream& output) const = 0;
    virtual void PrintTexts(std::ostream& output) const = 0;
};

std::unique_ptr<SheetInterface> CreateSheet();
