//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser_Stmt.cpp
// Purpose: Statement productions and their code shapes.
// Key invariants: Branch targets are placed immediately after the body they
//                 skip; `if` allocates its label after the body, `while`
//                 allocates both labels before the condition.
// Ownership/Lifetime: Returned fragments own their nodes and instructions.
// Links: src/frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pl0::frontend
{

using bytecode::Instr;
using bytecode::makeInstr;
using bytecode::makeLabel;
using bytecode::Opcode;
using bytecode::Operand;

namespace
{

void append(std::vector<Instr> &dst, std::vector<Instr> &&src)
{
    dst.insert(dst.end(),
               std::make_move_iterator(src.begin()),
               std::make_move_iterator(src.end()));
}

} // namespace

/// @brief Dispatch on the leading token; anything unrecognized is the empty statement.
StmtFragment Parser::parseStatement()
{
    if (hasError_)
        return {};

    switch (current_.kind)
    {
        case TokenKind::KwCall:
            return parseCall();
        case TokenKind::KwIf:
            return parseIf();
        case TokenKind::KwWhile:
            return parseWhile();
        case TokenKind::KwBegin:
            return parseCompound();
        case TokenKind::KwPush:
            return parseStackOp(StmtKind::Push);
        case TokenKind::KwPop:
            return parseStackOp(StmtKind::Pop);
        case TokenKind::KwPeek:
            return parseMemoryOp(StmtKind::Peek);
        case TokenKind::KwPoke:
            return parseMemoryOp(StmtKind::Poke);
        case TokenKind::Identifier:
            return parseAssign();
        default:
            break;
    }

    StmtFragment empty;
    empty.node = std::make_unique<EmptyStmt>(current_.loc);
    return empty;
}

/// @brief assign := ident ':=' expr ';'
StmtFragment Parser::parseAssign()
{
    const Token name = advance();
    if (!expect(TokenKind::Assign, "':='"))
        return {};
    auto value = parseExpression();
    if (!value)
        return {};
    if (!expect(TokenKind::Semicolon, "';'"))
        return {};
    auto addr = lookupVariable(name);
    if (!addr)
        return {};

    StmtFragment out;
    out.code = std::move(value.code);
    out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(0), Operand::addr(*addr)}));
    out.node = std::make_unique<AssignStmt>(name.text, *addr, std::move(value.node), name.loc);
    return out;
}

/// @brief call := 'call' ident ';'
StmtFragment Parser::parseCall()
{
    const auto loc = advance().loc;
    auto name = expectIdentifier();
    if (!name || !expect(TokenKind::Semicolon, "';'"))
        return {};
    if (name->text != programName_ && !registry_.contains(name->text))
    {
        errorAt(name->loc, "call to unknown program '" + name->text + "'", "P1004");
        return {};
    }

    StmtFragment out;
    out.code.push_back(makeInstr(Opcode::PL0CALL, {Operand::sym(name->text)}));
    out.node = std::make_unique<CallStmt>(name->text, loc);
    return out;
}

/// @brief ifStmt := 'if' expr 'then' statement
StmtFragment Parser::parseIf()
{
    const auto loc = advance().loc;
    auto cond = parseExpression();
    if (!cond || !expect(TokenKind::KwThen, "'then'"))
        return {};
    auto body = parseStatement();
    if (!body)
        return {};
    std::string skip = newLabel();

    StmtFragment out;
    out.code = std::move(cond.code);
    out.code.push_back(makeInstr(Opcode::JZ, {Operand::reg(0), Operand::sym(skip)}));
    append(out.code, std::move(body.code));
    out.code.push_back(makeLabel(skip));
    out.node = std::make_unique<IfStmt>(std::move(cond.node), std::move(body.node), skip, loc);
    return out;
}

/// @brief whileStmt := 'while' expr 'do' statement
StmtFragment Parser::parseWhile()
{
    const auto loc = advance().loc;
    std::string start = newLabel();
    std::string exit = newLabel();

    auto cond = parseExpression();
    if (!cond || !expect(TokenKind::KwDo, "'do'"))
        return {};
    auto body = parseStatement();
    if (!body)
        return {};

    StmtFragment out;
    out.code.push_back(makeLabel(start));
    append(out.code, std::move(cond.code));
    out.code.push_back(makeInstr(Opcode::JZ, {Operand::reg(0), Operand::sym(exit)}));
    append(out.code, std::move(body.code));
    out.code.push_back(makeInstr(Opcode::JMP, {Operand::sym(start)}));
    out.code.push_back(makeLabel(exit));
    out.node = std::make_unique<WhileStmt>(
        std::move(cond.node), std::move(body.node), std::move(start), std::move(exit), loc);
    return out;
}

/// @brief compound := 'begin' statement (';'? statement)* 'end'
/// @details An empty statement must be followed by ';' or 'end'; otherwise
///          the loop could not make progress.
StmtFragment Parser::parseCompound()
{
    auto node = std::make_unique<CompoundStmt>(advance().loc);
    std::vector<Instr> code;

    while (!check(TokenKind::KwEnd))
    {
        auto stmt = parseStatement();
        if (!stmt)
            return {};
        const bool empty = stmt.node->kind == StmtKind::Empty;
        node->statements.push_back(std::move(stmt.node));
        append(code, std::move(stmt.code));

        if (match(TokenKind::Semicolon) || hasError_)
            continue;
        if (empty && !check(TokenKind::KwEnd))
        {
            error(std::string("unexpected ") + tokenKindToString(current_.kind) +
                      " where a statement was expected",
                  "P1008");
            return {};
        }
    }
    if (hasError_)
        return {};
    advance(); // 'end'

    StmtFragment out;
    out.node = std::move(node);
    out.code = std::move(code);
    return out;
}

/// @brief push := 'push' ident ';'   pop := 'pop' ident ';'
StmtFragment Parser::parseStackOp(StmtKind kind)
{
    const auto loc = advance().loc;
    auto name = expectIdentifier();
    if (!name || !expect(TokenKind::Semicolon, "';'"))
        return {};
    auto addr = lookupVariable(*name);
    if (!addr)
        return {};

    StmtFragment out;
    if (kind == StmtKind::Push)
    {
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::addr(*addr)}));
        out.code.push_back(makeInstr(Opcode::PUSH, {Operand::reg(0)}));
    }
    else
    {
        out.code.push_back(makeInstr(Opcode::POP, {Operand::reg(0)}));
        out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(0), Operand::addr(*addr)}));
    }
    out.node = std::make_unique<StackStmt>(kind, name->text, *addr, loc);
    return out;
}

/// @brief peek := 'peek' '(' dest ',' addrVar ')' ';'
///        poke := 'poke' '(' addrVar ',' valueVar ')' ';'
StmtFragment Parser::parseMemoryOp(StmtKind kind)
{
    const auto loc = advance().loc;
    if (!expect(TokenKind::LParen, "'('"))
        return {};
    auto first = expectIdentifier();
    if (!first || !expect(TokenKind::Comma, "','"))
        return {};
    auto second = expectIdentifier();
    if (!second || !expect(TokenKind::RParen, "')'") || !expect(TokenKind::Semicolon, "';'"))
        return {};
    auto firstAddr = lookupVariable(*first);
    if (!firstAddr)
        return {};
    auto secondAddr = lookupVariable(*second);
    if (!secondAddr)
        return {};

    StmtFragment out;
    if (kind == StmtKind::Peek)
    {
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::addr(*secondAddr)}));
        out.code.push_back(makeInstr(Opcode::PEEK, {Operand::reg(1), Operand::regAddr(0)}));
        out.code.push_back(makeInstr(Opcode::STORE, {Operand::reg(1), Operand::addr(*firstAddr)}));
    }
    else
    {
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(0), Operand::addr(*firstAddr)}));
        out.code.push_back(makeInstr(Opcode::LOAD, {Operand::reg(1), Operand::addr(*secondAddr)}));
        out.code.push_back(makeInstr(Opcode::POKE, {Operand::reg(1), Operand::regAddr(0)}));
    }
    out.node = std::make_unique<MemoryStmt>(kind, first->text, second->text, loc);
    return out;
}

} // namespace pl0::frontend
