//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser.cpp
// Purpose: Token handling, symbol/temp/label allocation and the program and
//          block productions of the PL/0 parser.
// Key invariants: hasError_ is set by the first error and never cleared.
// Ownership/Lifetime: Parser borrows Lexer, DiagnosticEngine and registry.
// Links: src/frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Parser.hpp"

namespace pl0::frontend
{

using bytecode::Instr;
using bytecode::makeInstr;
using bytecode::Opcode;
using bytecode::Operand;

Parser::Parser(Lexer &lexer,
               support::DiagnosticEngine &diag,
               const CompilerOptions &options,
               const bytecode::ProgramRegistry &registry)
    : lexer_(lexer), diag_(diag), options_(options), registry_(registry),
      nextVarAddr_(options.baseAddress),
      nextTempAddr_(static_cast<int64_t>(options.memorySize) - 2)
{
    current_ = lexer_.next();
    if (current_.kind == TokenKind::Error)
        hasError_ = true;
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek() const
{
    return current_;
}

Token Parser::advance()
{
    Token result = current_;
    current_ = lexer_.next();
    // The lexer has already reported the problem.
    if (current_.kind == TokenKind::Error)
        hasError_ = true;
    return result;
}

bool Parser::check(TokenKind kind) const
{
    return current_.kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    error(std::string("expected ") + what + ", got " + tokenKindToString(current_.kind), "P1001");
    return false;
}

std::optional<Token> Parser::expectIdentifier()
{
    if (check(TokenKind::Identifier))
        return advance();
    error(std::string("expected identifier, got ") + tokenKindToString(current_.kind), "P1001");
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

void Parser::error(const std::string &message, const char *code)
{
    errorAt(current_.loc, message, code);
}

void Parser::errorAt(support::SourceLoc loc, const std::string &message, const char *code)
{
    // Only the first problem is reported; an Error token was reported by the lexer.
    if (hasError_)
        return;
    hasError_ = true;
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, code});
}

//===----------------------------------------------------------------------===//
// Symbols, temporaries and labels
//===----------------------------------------------------------------------===//

std::optional<int64_t> Parser::declareVariable(const std::string &name, support::SourceLoc loc)
{
    if (variables_.count(name) != 0)
    {
        const bool reported = !hasError_;
        errorAt(loc, "variable '" + name + "' already declared", "P1002");
        if (reported)
            diag_.report(support::Diagnostic{support::Severity::Note,
                                             "previous declaration of '" + name + "' is here",
                                             declaredAt_[name], "P1002"});
        return std::nullopt;
    }
    const int64_t addr = nextVarAddr_;
    if (addr < 0 || addr >= static_cast<int64_t>(options_.memorySize))
    {
        errorAt(loc,
                "variable '" + name + "' would be placed at address " + std::to_string(addr) +
                    ", outside memory of size " + std::to_string(options_.memorySize),
                "P1009");
        return std::nullopt;
    }
    ++nextVarAddr_;
    variables_.emplace(name, addr);
    declaredAt_.emplace(name, loc);
    return addr;
}

std::optional<int64_t> Parser::lookupVariable(const Token &name)
{
    auto it = variables_.find(name.text);
    if (it == variables_.end())
    {
        errorAt(name.loc, "unknown variable '" + name.text + "'", "P1003");
        return std::nullopt;
    }
    return it->second;
}

std::optional<int64_t> Parser::allocateTemp(support::SourceLoc loc)
{
    const int64_t addr = nextTempAddr_;
    if (addr < 0 || addr < nextVarAddr_)
    {
        errorAt(loc,
                "expression too complex: temporary address " + std::to_string(addr) +
                    " would overlap variables ending at " + std::to_string(nextVarAddr_ - 1),
                "P1010");
        return std::nullopt;
    }
    --nextTempAddr_;
    return addr;
}

std::string Parser::newLabel()
{
    return "label_" + std::to_string(labelCounter_++);
}

//===----------------------------------------------------------------------===//
// Program and block
//===----------------------------------------------------------------------===//

/// @brief program := 'program' ident ';' block '.'
Fragment<ProgramDecl> Parser::parseProgram()
{
    Fragment<ProgramDecl> result;
    auto decl = std::make_unique<ProgramDecl>();
    decl->loc = current_.loc;

    if (!expect(TokenKind::KwProgram, "'program'"))
        return result;
    auto name = expectIdentifier();
    if (!name)
        return result;
    decl->name = name->text;
    programName_ = name->text;
    if (!expect(TokenKind::Semicolon, "';'"))
        return result;

    std::vector<Instr> code;
    if (!parseBlock(decl->block, code))
        return result;
    if (!expect(TokenKind::Dot, "'.'"))
        return result;
    if (!check(TokenKind::Eof))
    {
        error(std::string("unexpected ") + tokenKindToString(current_.kind) +
                  " after end of program '" + decl->name + "'",
              "P1007");
        return result;
    }

    code.push_back(makeInstr(Opcode::RET));
    result.node = std::move(decl);
    result.code = std::move(code);
    return result;
}

/// @brief block := varDecl? statement
bool Parser::parseBlock(Block &block, std::vector<Instr> &code)
{
    if (check(TokenKind::KwVar) && !parseVarDecl(block.vars))
        return false;

    auto body = parseStatement();
    if (!body)
        return false;
    block.body = std::move(body.node);
    code = std::move(body.code);
    return true;
}

/// @brief varDecl := 'var' ident (',' ident)* ';'
bool Parser::parseVarDecl(std::vector<VarDecl> &vars)
{
    advance(); // 'var'
    do
    {
        auto name = expectIdentifier();
        if (!name)
            return false;
        auto addr = declareVariable(name->text, name->loc);
        if (!addr)
            return false;
        vars.push_back(VarDecl{name->text, *addr, name->loc});
    } while (match(TokenKind::Comma));

    return expect(TokenKind::Semicolon, "';'");
}

} // namespace pl0::frontend
