//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser_Expr.cpp
// Purpose: Expression productions, fixed-point sugar and intrinsic lowering.
// Key invariants: Every expression leaves its value in r0. A binary node owns
//                 exactly one temporary, allocated after its right operand.
//                 Real literals and pi/tau/e are encoded with the compile-time
//                 scale; integer literals stay unscaled.
// Ownership/Lifetime: Returned fragments own their nodes and instructions.
// Links: src/frontend/Parser.hpp, src/common/FixedPoint.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

#include "common/CharUtils.hpp"
#include "common/FixedPoint.hpp"

#include <array>
#include <numbers>
#include <string_view>

namespace pl0::frontend
{

using bytecode::Instr;
using bytecode::makeInstr;
using bytecode::Opcode;
using bytecode::Operand;
using common::MathOp;

namespace
{

struct IntrinsicEntry
{
    std::string_view name;
    MathOp op;
};

constexpr std::array<IntrinsicEntry, 11> kIntrinsics = {{
    {"sin", MathOp::Sin},
    {"cos", MathOp::Cos},
    {"tan", MathOp::Tan},
    {"tanh", MathOp::Tanh},
    {"sinh", MathOp::Sinh},
    {"cosh", MathOp::Cosh},
    {"ln", MathOp::Ln},
    {"log", MathOp::Log10},
    {"log10", MathOp::Log10},
    {"exp", MathOp::Exp},
    {"sqrt", MathOp::Sqrt},
}};

struct ConstantEntry
{
    std::string_view name;
    double value;
};

constexpr std::array<ConstantEntry, 3> kConstants = {{
    {"pi", std::numbers::pi},
    {"tau", 2.0 * std::numbers::pi},
    {"e", std::numbers::e},
}};

std::string supportedCallList()
{
    std::string list;
    for (const auto &entry : kIntrinsics)
    {
        list += entry.name;
        list += ", ";
    }
    list += "fx, tofx, int, fromfx, unfx";
    return list;
}

} // namespace

/// @brief expr := term (('+'|'-') term)*
ExprFragment Parser::parseExpression()
{
    if (hasError_)
        return {};

    auto lhs = parseTerm();
    if (!lhs)
        return {};

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        const Token op = advance();
        auto rhs = parseTerm();
        if (!rhs)
            return {};
        lhs = emitBinary(op.kind == TokenKind::Plus ? BinaryExpr::Op::Add : BinaryExpr::Op::Sub,
                         std::move(lhs),
                         std::move(rhs),
                         op.loc);
        if (!lhs)
            return {};
    }
    return lhs;
}

/// @brief term := factor (('*'|'/') factor)*
ExprFragment Parser::parseTerm()
{
    auto lhs = parseFactor();
    if (!lhs)
        return {};

    while (check(TokenKind::Star) || check(TokenKind::Slash))
    {
        const Token op = advance();
        auto rhs = parseFactor();
        if (!rhs)
            return {};
        lhs = emitBinary(op.kind == TokenKind::Star ? BinaryExpr::Op::Mul : BinaryExpr::Op::Div,
                         std::move(lhs),
                         std::move(rhs),
                         op.loc);
        if (!lhs)
            return {};
    }
    return lhs;
}

/// @brief Spill the left operand, evaluate the right one, then combine.
/// @details ADD and MUL combine directly into r0. SUB and DIV compute
///          r1 = left op right and move the result back to r0 through the
///          same temporary cell.
ExprFragment Parser::emitBinary(BinaryExpr::Op op,
                                ExprFragment lhs,
                                ExprFragment rhs,
                                support::SourceLoc loc)
{
    auto temp = allocateTemp(loc);
    if (!temp)
        return {};
    const int64_t t = *temp;

    ExprFragment out;
    out.code = std::move(lhs.code);
    out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(0), Operand::addr(t)}));
    out.code.insert(out.code.end(),
                    std::make_move_iterator(rhs.code.begin()),
                    std::make_move_iterator(rhs.code.end()));
    out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(1), Operand::addr(t)}));

    switch (op)
    {
        case BinaryExpr::Op::Add:
            out.code.push_back(makeInstr(Opcode::ADD, {Operand::reg(0), Operand::reg(1)}));
            break;
        case BinaryExpr::Op::Mul:
            out.code.push_back(makeInstr(Opcode::MUL, {Operand::reg(0), Operand::reg(1)}));
            break;
        case BinaryExpr::Op::Sub:
        case BinaryExpr::Op::Div:
        {
            const Opcode code = op == BinaryExpr::Op::Sub ? Opcode::SUB : Opcode::DIV;
            out.code.push_back(makeInstr(code, {Operand::reg(1), Operand::reg(0)}));
            out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(1), Operand::addr(t)}));
            out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::addr(t)}));
            break;
        }
    }

    out.node = std::make_unique<BinaryExpr>(op, std::move(lhs.node), std::move(rhs.node), t, loc);
    return out;
}

/// @brief factor := number | real | ident ['(' expr ')'] | '(' expr ')'
ExprFragment Parser::parseFactor()
{
    if (hasError_)
        return {};

    switch (current_.kind)
    {
        case TokenKind::IntegerLiteral:
        {
            const Token tok = advance();
            ExprFragment out;
            out.code.push_back(
                makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::imm(tok.intValue)}));
            out.node = std::make_unique<NumberExpr>(tok.intValue, false, tok.text, tok.loc);
            return out;
        }
        case TokenKind::RealLiteral:
        {
            const Token tok = advance();
            const int64_t scaled = common::fixed::encode(tok.realValue, options_.fxScale);
            ExprFragment out;
            out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::imm(scaled)}));
            out.node = std::make_unique<NumberExpr>(scaled, true, tok.text, tok.loc);
            return out;
        }
        case TokenKind::Identifier:
        {
            const Token name = advance();
            if (check(TokenKind::LParen))
                return parseCallLike(name);
            return parseNameRef(name);
        }
        case TokenKind::LParen:
        {
            advance();
            auto inner = parseExpression();
            if (!inner || !expect(TokenKind::RParen, "')'"))
                return {};
            return inner;
        }
        default:
            break;
    }

    error(std::string("unexpected ") + tokenKindToString(current_.kind) + " in expression",
          "P1006");
    return {};
}

/// @brief Lower `name(expr)` to a math instruction or a fixed-point conversion.
ExprFragment Parser::parseCallLike(const Token &name)
{
    advance(); // '('
    auto arg = parseExpression();
    if (!arg || !expect(TokenKind::RParen, "')'"))
        return {};

    const std::string lower = common::char_utils::toLowercase(name.text);

    for (const auto &entry : kIntrinsics)
    {
        if (entry.name != lower)
            continue;
        ExprFragment out;
        out.code = std::move(arg.code);
        out.code.push_back(makeInstr(bytecode::opcodeFor(entry.op), {Operand::reg(0)}));
        out.node =
            std::make_unique<IntrinsicExpr>(name.text, entry.op, std::move(arg.node), name.loc);
        return out;
    }

    const int64_t scale = options_.fxScale;

    if (lower == "fx" || lower == "tofx")
    {
        auto temp = allocateTemp(name.loc);
        if (!temp)
            return {};
        ExprFragment out;
        out.code = std::move(arg.code);
        out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(0), Operand::addr(*temp)}));
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::imm(scale)}));
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(1), Operand::addr(*temp)}));
        out.code.push_back(makeInstr(Opcode::MUL, {Operand::reg(0), Operand::reg(1)}));
        out.node = std::make_unique<FixedConvertExpr>(
            FixedConvertExpr::Direction::ToFixed, std::move(arg.node), name.loc);
        return out;
    }

    if (lower == "int" || lower == "fromfx" || lower == "unfx")
    {
        ExprFragment out;
        out.code = std::move(arg.code);
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(1), Operand::imm(scale)}));
        out.code.push_back(makeInstr(Opcode::DIV, {Operand::reg(0), Operand::reg(1)}));
        out.node = std::make_unique<FixedConvertExpr>(
            FixedConvertExpr::Direction::FromFixed, std::move(arg.node), name.loc);
        return out;
    }

    errorAt(name.loc,
            "unknown intrinsic '" + name.text + "(...)'; supported: " + supportedCallList(),
            "P1005");
    return {};
}

/// @brief Variables shadow the built-in constants pi, tau and e.
ExprFragment Parser::parseNameRef(const Token &name)
{
    auto it = variables_.find(name.text);
    if (it != variables_.end())
    {
        ExprFragment out;
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::addr(it->second)}));
        out.node = std::make_unique<VariableRefExpr>(name.text, it->second, name.loc);
        return out;
    }

    const std::string lower = common::char_utils::toLowercase(name.text);
    for (const auto &constant : kConstants)
    {
        if (constant.name != lower)
            continue;
        const int64_t scaled = common::fixed::encode(constant.value, options_.fxScale);
        ExprFragment out;
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::imm(scaled)}));
        out.node = std::make_unique<ConstantRefExpr>(lower, scaled, name.loc);
        return out;
    }

    errorAt(name.loc, "unknown variable '" + name.text + "'", "P1003");
    return {};
}

} // namespace pl0::frontend
