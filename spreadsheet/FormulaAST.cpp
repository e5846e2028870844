#include "FormulaAST.h"

#include "FormulaBaseListener.h"
#include "FormulaLexer.h"
#include "FormulaParser.h"

#include <cassert>
#include <climits>
#include <cmath>
#include <memory>
#include <sstream>
#include <type_traits>
#include <variant>

namespace ASTImpl {

enum ExprPrecedence {
    EP_ADD,
    EP_SUB,
    EP_MUL,
    EP_DIV,
    EP_UNARY,
    EP_ATOM,
    EP_END,
};

// a bit is set when the parentheses are needed
enum PrecedenceRule {
    PR_NONE = 0b00,                // never needed
    PR_LEFT = 0b01,                // needed for a left child
    PR_RIGHT = 0b10,               // needed for a right child
    PR_BOTH = PR_LEFT | PR_RIGHT,  // needed for both children
};

// PRECEDENCE_RULES[parent][child] tells whether a child of the given precedence
// must be wrapped in parentheses so that printing and re-parsing yields the same tree:
// A - (B + C) and A / (B * C) keep them on the right, -(A + B) keeps them always.
// Unary plus over a sum always keeps them, e.g. +(A + B) / C.
constexpr PrecedenceRule PRECEDENCE_RULES[EP_END][EP_END] = {
    /* EP_ADD */ {PR_NONE, PR_NONE, PR_NONE, PR_NONE, PR_NONE, PR_NONE},
    /* EP_SUB */ {PR_RIGHT, PR_RIGHT, PR_NONE, PR_NONE, PR_NONE, PR_NONE},
    /* EP_MUL */ {PR_BOTH, PR_BOTH, PR_NONE, PR_NONE, PR_NONE, PR_NONE},
    /* EP_DIV */ {PR_BOTH, PR_BOTH, PR_RIGHT, PR_RIGHT, PR_NONE, PR_NONE},
    /* EP_UNARY */ {PR_BOTH, PR_BOTH, PR_NONE, PR_NONE, PR_NONE, PR_NONE},
    /* EP_ATOM */ {PR_NONE, PR_NONE, PR_NONE, PR_NONE, PR_NONE, PR_NONE},
};

using ExprPtr = std::unique_ptr<Expr>;

struct NumberExpr {
    double value;
};

// pos is Position::NONE when the reference does not address a cell
struct CellExpr {
    Position pos;
};

struct UnaryOpExpr {
    enum Type : char {
        UnaryPlus = '+',
        UnaryMinus = '-',
    };

    Type type;
    ExprPtr operand;
};

struct BinaryOpExpr {
    enum Type : char {
        Add = '+',
        Subtract = '-',
        Multiply = '*',
        Divide = '/',
    };

    Type type;
    ExprPtr lhs;
    ExprPtr rhs;
};

struct Expr {
    std::variant<NumberExpr, CellExpr, UnaryOpExpr, BinaryOpExpr> node;
};

namespace {

template <typename T>
ExprPtr MakeExpr(T node) {
    return std::make_unique<Expr>(Expr{std::move(node)});
}

// higher is tighter
ExprPrecedence GetPrecedence(const Expr& expr) {
    return std::visit([](const auto& node) -> ExprPrecedence {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, UnaryOpExpr>) {
            return EP_UNARY;
        } else if constexpr (std::is_same_v<T, BinaryOpExpr>) {
            switch (node.type) {
                case BinaryOpExpr::Add:
                    return EP_ADD;
                case BinaryOpExpr::Subtract:
                    return EP_SUB;
                case BinaryOpExpr::Multiply:
                    return EP_MUL;
                case BinaryOpExpr::Divide:
                    return EP_DIV;
            }
            assert(false);
            return static_cast<ExprPrecedence>(INT_MAX);
        } else {
            return EP_ATOM;
        }
    }, expr.node);
}

// Same precision as displayed cell values, independent of the stream's setting
void PrintNumber(std::ostream& out, double value) {
    auto precision = out.precision(15);
    out << value;
    out.precision(precision);
}

void PrintCell(std::ostream& out, Position pos) {
    if (!pos.IsValid()) {
        out << FormulaError::Category::Ref;
    } else {
        out << pos.ToString();
    }
}

void Print(const Expr& expr, std::ostream& out) {
    std::visit([&out](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, NumberExpr>) {
            PrintNumber(out, node.value);
        } else if constexpr (std::is_same_v<T, CellExpr>) {
            PrintCell(out, node.pos);
        } else if constexpr (std::is_same_v<T, UnaryOpExpr>) {
            out << '(' << static_cast<char>(node.type) << ' ';
            Print(*node.operand, out);
            out << ')';
        } else {
            out << '(' << static_cast<char>(node.type) << ' ';
            Print(*node.lhs, out);
            out << ' ';
            Print(*node.rhs, out);
            out << ')';
        }
    }, expr.node);
}

void PrintFormula(const Expr& expr, std::ostream& out, ExprPrecedence parent_precedence,
                  bool right_child = false) {
    auto precedence = GetPrecedence(expr);
    auto mask = right_child ? PR_RIGHT : PR_LEFT;
    bool parens_needed = PRECEDENCE_RULES[parent_precedence][precedence] & mask;
    if (parens_needed) {
        out << '(';
    }

    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, NumberExpr>) {
            PrintNumber(out, node.value);
        } else if constexpr (std::is_same_v<T, CellExpr>) {
            PrintCell(out, node.pos);
        } else if constexpr (std::is_same_v<T, UnaryOpExpr>) {
            out << static_cast<char>(node.type);
            PrintFormula(*node.operand, out, precedence);
        } else {
            PrintFormula(*node.lhs, out, precedence);
            out << static_cast<char>(node.type);
            PrintFormula(*node.rhs, out, precedence, /* right_child = */ true);
        }
    }, expr.node);

    if (parens_needed) {
        out << ')';
    }
}

FormulaValue ApplyBinaryOp(BinaryOpExpr::Type type, double left, double right) {
    double result = 0;
    switch (type) {
        case BinaryOpExpr::Add:
            result = left + right;
            break;
        case BinaryOpExpr::Subtract:
            result = left - right;
            break;
        case BinaryOpExpr::Multiply:
            result = left * right;
            break;
        case BinaryOpExpr::Divide:
            if (right == 0) {
                return FormulaError(FormulaError::Category::Div0);
            }
            result = left / right;
            break;
    }

    if (std::isfinite(result)) {
        return result;
    }
    return FormulaError(FormulaError::Category::Arithmetic);
}

FormulaValue Evaluate(const Expr& expr, const CellResolver& resolve) {
    return std::visit([&resolve](const auto& node) -> FormulaValue {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, NumberExpr>) {
            return node.value;
        } else if constexpr (std::is_same_v<T, CellExpr>) {
            if (!node.pos.IsValid()) {
                return FormulaError(FormulaError::Category::Ref);
            }
            return resolve(node.pos);
        } else if constexpr (std::is_same_v<T, UnaryOpExpr>) {
            auto operand = Evaluate(*node.operand, resolve);
            if (std::holds_alternative<FormulaError>(operand)) {
                return operand;
            }
            double value = std::get<double>(operand);
            return node.type == UnaryOpExpr::UnaryMinus ? -value : value;
        } else {
            auto left = Evaluate(*node.lhs, resolve);
            if (std::holds_alternative<FormulaError>(left)) {
                return left;
            }
            auto right = Evaluate(*node.rhs, resolve);
            if (std::holds_alternative<FormulaError>(right)) {
                return right;
            }
            return ApplyBinaryOp(node.type, std::get<double>(left), std::get<double>(right));
        }
    }, expr.node);
}

class ParseASTListener final : public FormulaBaseListener {
public:
    ExprPtr MoveRoot() {
        assert(args_.size() == 1);
        auto root = std::move(args_.front());
        args_.clear();

        return root;
    }

    std::set<Position> GetCells() const {
        return cells_;
    }

public:
    void exitUnaryOp(FormulaParser::UnaryOpContext* ctx) override {
        assert(args_.size() >= 1);

        auto operand = std::move(args_.back());

        UnaryOpExpr::Type type;
        if (ctx->SUB()) {
            type = UnaryOpExpr::UnaryMinus;
        } else {
            assert(ctx->ADD() != nullptr);
            type = UnaryOpExpr::UnaryPlus;
        }

        args_.back() = MakeExpr(UnaryOpExpr{type, std::move(operand)});
    }

    void exitLiteral(FormulaParser::LiteralContext* ctx) override {
        double value = 0;
        auto valueStr = ctx->NUMBER()->getSymbol()->getText();
        std::istringstream in(valueStr);
        in >> value;
        if (!in) {
            throw ParsingError("Invalid number: " + valueStr);
        }

        args_.push_back(MakeExpr(NumberExpr{value}));
    }

    void exitCell(FormulaParser::CellContext* ctx) override {
        Position pos = Position::FromString(ctx->getText());
        if (pos.IsValid()) {
            cells_.insert(pos);
        }
        args_.push_back(MakeExpr(CellExpr{pos}));
    }

    void exitBinaryOp(FormulaParser::BinaryOpContext* ctx) override {
        assert(args_.size() >= 2);

        auto rhs = std::move(args_.back());
        args_.pop_back();

        auto lhs = std::move(args_.back());

        BinaryOpExpr::Type type;
        if (ctx->ADD()) {
            type = BinaryOpExpr::Add;
        } else if (ctx->SUB()) {
            type = BinaryOpExpr::Subtract;
        } else if (ctx->MUL()) {
            type = BinaryOpExpr::Multiply;
        } else {
            assert(ctx->DIV() != nullptr);
            type = BinaryOpExpr::Divide;
        }

        args_.back() = MakeExpr(BinaryOpExpr{type, std::move(lhs), std::move(rhs)});
    }

    void visitErrorNode(antlr4::tree::ErrorNode* node) override {
        throw ParsingError("Error when parsing: " + node->getSymbol()->getText());
    }

private:
    std::vector<ExprPtr> args_;
    std::set<Position> cells_;
};

class BailErrorListener : public antlr4::BaseErrorListener {
public:
    void syntaxError(antlr4::Recognizer* /* recognizer */, antlr4::Token* /* offendingSymbol */,
                     size_t /* line */, size_t /* charPositionInLine */, const std::string& msg,
                     std::exception_ptr /* e */
                     ) override {
        throw ParsingError("Error when lexing: " + msg);
    }
};

}  // namespace
}  // namespace ASTImpl

FormulaAST ParseFormulaAST(std::istream& in) {
    using namespace antlr4;

    ANTLRInputStream input(in);

    FormulaLexer lexer(&input);
    ASTImpl::BailErrorListener error_listener;
    lexer.removeErrorListeners();
    lexer.addErrorListener(&error_listener);

    CommonTokenStream tokens(&lexer);

    FormulaParser parser(&tokens);
    auto error_handler = std::make_shared<BailErrorStrategy>();
    parser.setErrorHandler(error_handler);
    parser.removeErrorListeners();

    tree::ParseTree* tree = parser.main();
    ASTImpl::ParseASTListener listener;
    tree::ParseTreeWalker::DEFAULT.walk(&listener, tree);

    return FormulaAST(listener.MoveRoot(), listener.GetCells());
}

FormulaAST ParseFormulaAST(const std::string& in_str) {
    std::istringstream in(in_str);
    try {
        return ParseFormulaAST(in);
    } catch (const std::exception& exc) {
        std::throw_with_nested(FormulaException(exc.what()));
    }
}

void FormulaAST::Print(std::ostream& out) const {
    ASTImpl::Print(*root_expr_, out);
}

void FormulaAST::PrintFormula(std::ostream& out) const {
    ASTImpl::PrintFormula(*root_expr_, out, ASTImpl::EP_ATOM);
}

FormulaValue FormulaAST::Execute(const CellResolver& resolve) const {
    return ASTImpl::Evaluate(*root_expr_, resolve);
}

std::vector<Position> FormulaAST::GetReferencedCells() const {
    return cells_;
}

FormulaAST::FormulaAST(std::unique_ptr<ASTImpl::Expr> root_expr, const std::set<Position>& cells)
    : root_expr_(std::move(root_expr))
    , cells_(cells.begin(), cells.end()) {
}

FormulaAST::~FormulaAST() = default;
