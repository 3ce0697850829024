//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/AST.hpp
// Purpose: Abstract syntax tree built alongside code generation.
// Key invariants: Nodes record resolved addresses and scaled constants exactly
//                 as emitted; the tree is never re-walked to produce code.
// Ownership/Lifetime: Parents own children through std::unique_ptr.
// Links: src/frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/MathReference.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace pl0::frontend
{

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

enum class ExprKind
{
    Number,
    VariableRef,
    ConstantRef,
    Binary,
    Intrinsic,
    FixedConvert,
};

/// @brief Base class for all expressions.
struct Expr
{
    ExprKind kind;
    support::SourceLoc loc;

    explicit Expr(ExprKind k, support::SourceLoc l = {}) : kind(k), loc(l) {}

    virtual ~Expr() = default;
};

/// @brief Integer literal, or real literal already encoded as fixed-point.
struct NumberExpr : Expr
{
    int64_t value;   ///< Value loaded into the accumulator.
    bool isFixed;    ///< True when @ref value is a scaled real literal.
    std::string raw; ///< Literal as written.

    NumberExpr(int64_t v, bool fixed, std::string text, support::SourceLoc l = {})
        : Expr(ExprKind::Number, l), value(v), isFixed(fixed), raw(std::move(text))
    {
    }
};

/// @brief Reference to a declared variable.
struct VariableRefExpr : Expr
{
    std::string name;
    int64_t address;

    VariableRefExpr(std::string n, int64_t addr, support::SourceLoc l = {})
        : Expr(ExprKind::VariableRef, l), name(std::move(n)), address(addr)
    {
    }
};

/// @brief Reference to a built-in constant (pi, tau, e), already scaled.
struct ConstantRefExpr : Expr
{
    std::string name;
    int64_t value;

    ConstantRefExpr(std::string n, int64_t v, support::SourceLoc l = {})
        : Expr(ExprKind::ConstantRef, l), name(std::move(n)), value(v)
    {
    }
};

/// @brief Binary arithmetic.
struct BinaryExpr : Expr
{
    enum class Op
    {
        Add, ///< +
        Sub, ///< -
        Mul, ///< *
        Div, ///< / (floor division)
    };

    Op op;
    std::unique_ptr<Expr> lhs;
    std::unique_ptr<Expr> rhs;
    int64_t tempAddress; ///< Spill cell holding the left operand.

    BinaryExpr(Op o,
               std::unique_ptr<Expr> l,
               std::unique_ptr<Expr> r,
               int64_t temp,
               support::SourceLoc loc = {})
        : Expr(ExprKind::Binary, loc), op(o), lhs(std::move(l)), rhs(std::move(r)),
          tempAddress(temp)
    {
    }
};

/// @brief Unary math intrinsic such as sin(x).
struct IntrinsicExpr : Expr
{
    std::string name; ///< Name as written.
    common::MathOp op;
    std::unique_ptr<Expr> arg;

    IntrinsicExpr(std::string n,
                  common::MathOp o,
                  std::unique_ptr<Expr> a,
                  support::SourceLoc l = {})
        : Expr(ExprKind::Intrinsic, l), name(std::move(n)), op(o), arg(std::move(a))
    {
    }
};

/// @brief fx()/tofx() or int()/fromfx()/unfx() conversion.
struct FixedConvertExpr : Expr
{
    enum class Direction
    {
        ToFixed,   ///< multiply by scale
        FromFixed, ///< floor-divide by scale
    };

    Direction direction;
    std::unique_ptr<Expr> arg;

    FixedConvertExpr(Direction d, std::unique_ptr<Expr> a, support::SourceLoc l = {})
        : Expr(ExprKind::FixedConvert, l), direction(d), arg(std::move(a))
    {
    }
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

enum class StmtKind
{
    Empty,
    Assign,
    Call,
    If,
    While,
    Compound,
    Push,
    Pop,
    Peek,
    Poke,
};

/// @brief Base class for all statements.
struct Stmt
{
    StmtKind kind;
    support::SourceLoc loc;

    explicit Stmt(StmtKind k, support::SourceLoc l = {}) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct EmptyStmt : Stmt
{
    explicit EmptyStmt(support::SourceLoc l = {}) : Stmt(StmtKind::Empty, l) {}
};

/// @brief name := expr
struct AssignStmt : Stmt
{
    std::string name;
    int64_t address;
    std::unique_ptr<Expr> value;

    AssignStmt(std::string n, int64_t addr, std::unique_ptr<Expr> v, support::SourceLoc l = {})
        : Stmt(StmtKind::Assign, l), name(std::move(n)), address(addr), value(std::move(v))
    {
    }
};

/// @brief call program
struct CallStmt : Stmt
{
    std::string program;

    CallStmt(std::string p, support::SourceLoc l = {})
        : Stmt(StmtKind::Call, l), program(std::move(p))
    {
    }
};

struct IfStmt : Stmt
{
    std::unique_ptr<Expr> condition;
    std::unique_ptr<Stmt> thenStmt;
    std::string skipLabel;

    IfStmt(std::unique_ptr<Expr> c,
           std::unique_ptr<Stmt> t,
           std::string label,
           support::SourceLoc l = {})
        : Stmt(StmtKind::If, l), condition(std::move(c)), thenStmt(std::move(t)),
          skipLabel(std::move(label))
    {
    }
};

struct WhileStmt : Stmt
{
    std::unique_ptr<Expr> condition;
    std::unique_ptr<Stmt> body;
    std::string startLabel;
    std::string exitLabel;

    WhileStmt(std::unique_ptr<Expr> c,
              std::unique_ptr<Stmt> b,
              std::string start,
              std::string exit,
              support::SourceLoc l = {})
        : Stmt(StmtKind::While, l), condition(std::move(c)), body(std::move(b)),
          startLabel(std::move(start)), exitLabel(std::move(exit))
    {
    }
};

struct CompoundStmt : Stmt
{
    std::vector<std::unique_ptr<Stmt>> statements;

    explicit CompoundStmt(support::SourceLoc l = {}) : Stmt(StmtKind::Compound, l) {}
};

/// @brief push/pop of a single variable (kind Push or Pop).
struct StackStmt : Stmt
{
    std::string name;
    int64_t address;

    StackStmt(StmtKind k, std::string n, int64_t addr, support::SourceLoc l = {})
        : Stmt(k, l), name(std::move(n)), address(addr)
    {
    }
};

/// @brief peek(dest, addrVar) / poke(addrVar, valueVar) (kind Peek or Poke).
/// @details For Peek, @ref first is the destination and @ref second holds the
///          address; for Poke, @ref first holds the address and @ref second
///          the value.
struct MemoryStmt : Stmt
{
    std::string first;
    std::string second;

    MemoryStmt(StmtKind k, std::string a, std::string b, support::SourceLoc l = {})
        : Stmt(k, l), first(std::move(a)), second(std::move(b))
    {
    }
};

//===----------------------------------------------------------------------===//
// Declarations
//===----------------------------------------------------------------------===//

struct VarDecl
{
    std::string name;
    int64_t address;
    support::SourceLoc loc;
};

struct Block
{
    std::vector<VarDecl> vars;
    std::unique_ptr<Stmt> body;
};

/// @brief Root node: program name ';' block '.'
struct ProgramDecl
{
    std::string name;
    Block block;
    support::SourceLoc loc;
};

/// @brief Print an indented outline of @p program.
void dumpAst(const ProgramDecl &program, std::ostream &os);

} // namespace pl0::frontend
