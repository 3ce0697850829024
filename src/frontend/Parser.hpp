//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Parser.hpp
// Purpose: Declares the recursive descent parser and code generator for PL/0.
// Key invariants: One-token lookahead; every production returns its AST node
//                 together with the instructions it emits; the first error
//                 stops parsing.
// Ownership/Lifetime: Parser borrows the Lexer, DiagnosticEngine and
//                     ProgramRegistry; it owns the symbol table and the temp
//                     and label allocators of one compilation.
// Links: src/frontend/AST.hpp, src/bytecode/Instr.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Instr.hpp"
#include "bytecode/ProgramRegistry.hpp"
#include "frontend/AST.hpp"
#include "frontend/CompilerOptions.hpp"
#include "frontend/Lexer.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace pl0::frontend
{

/// @brief An AST node paired with the instructions generated for it.
/// @details A null @ref node marks a failed production; @ref code is then
///          meaningless.
template <typename Node> struct Fragment
{
    std::unique_ptr<Node> node;
    std::vector<bytecode::Instr> code;

    explicit operator bool() const
    {
        return node != nullptr;
    }
};

using ExprFragment = Fragment<Expr>;
using StmtFragment = Fragment<Stmt>;

/// @brief Recursive descent parser that generates code as it parses.
/// @details Expressions evaluate into r0. A binary node spills its left
///          operand into a fresh temporary cell and reloads it into r1 after
///          the right operand has been computed. Temporaries descend from
///          memorySize - 2, variables ascend from the base address; the two
///          ranges meeting is a compile error.
///
/// Operator precedence (highest to lowest):
///   1. literals, names, intrinsic calls, parentheses
///   2. *, /
///   3. +, -
class Parser
{
  public:
    /// @brief Create a parser over the given lexer.
    /// @param lexer Lexer to read tokens from.
    /// @param diag Diagnostic engine for reporting errors.
    /// @param options Scale, base address and memory size for this program.
    /// @param registry Programs already compiled; consulted by `call`.
    Parser(Lexer &lexer,
           support::DiagnosticEngine &diag,
           const CompilerOptions &options,
           const bytecode::ProgramRegistry &registry);

    /// @brief Parse a complete program and append the implicit RET.
    /// @return The program AST and its instruction sequence; null node on error.
    Fragment<ProgramDecl> parseProgram();

    /// @brief Parse a single expression (for testing).
    ExprFragment parseExpression();

    /// @brief Parse a single statement (for testing).
    StmtFragment parseStatement();

    /// @brief Declare @p name as a variable at the next free address (for testing).
    /// @return The assigned address, or std::nullopt after reporting an error.
    std::optional<int64_t> declareVariable(const std::string &name, support::SourceLoc loc = {});

    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Token Handling
    //=========================================================================

    const Token &peek() const;
    Token advance();
    bool check(TokenKind kind) const;
    bool match(TokenKind kind);

    /// @brief Consume a token of @p kind or report P1001.
    bool expect(TokenKind kind, const char *what);

    /// @brief Consume an identifier or report P1001.
    std::optional<Token> expectIdentifier();

    //=========================================================================
    // Error Handling
    //=========================================================================

    void error(const std::string &message, const char *code);
    void errorAt(support::SourceLoc loc, const std::string &message, const char *code);

    //=========================================================================
    // Symbols, temporaries and labels
    //=========================================================================

    /// @brief Resolve a declared variable or report P1003.
    std::optional<int64_t> lookupVariable(const Token &name);

    /// @brief Allocate a fresh spill cell below the previous one or report P1010.
    std::optional<int64_t> allocateTemp(support::SourceLoc loc);

    /// @brief Produce the next unique label name.
    std::string newLabel();

    //=========================================================================
    // Declarations
    //=========================================================================

    bool parseBlock(Block &block, std::vector<bytecode::Instr> &code);
    bool parseVarDecl(std::vector<VarDecl> &vars);

    //=========================================================================
    // Statements
    //=========================================================================

    StmtFragment parseAssign();
    StmtFragment parseCall();
    StmtFragment parseIf();
    StmtFragment parseWhile();
    StmtFragment parseCompound();
    StmtFragment parseStackOp(StmtKind kind);
    StmtFragment parseMemoryOp(StmtKind kind);

    //=========================================================================
    // Expressions
    //=========================================================================

    ExprFragment parseTerm();
    ExprFragment parseFactor();

    /// @brief Parse `name '(' expr ')'` after @p name has been consumed.
    ExprFragment parseCallLike(const Token &name);

    /// @brief Resolve a bare identifier as a variable or built-in constant.
    ExprFragment parseNameRef(const Token &name);

    /// @brief Combine two operand fragments into a binary node.
    ExprFragment emitBinary(BinaryExpr::Op op,
                            ExprFragment lhs,
                            ExprFragment rhs,
                            support::SourceLoc loc);

    Lexer &lexer_;
    support::DiagnosticEngine &diag_;
    const CompilerOptions &options_;
    const bytecode::ProgramRegistry &registry_;

    Token current_;
    bool hasError_{false};

    std::string programName_;
    std::unordered_map<std::string, int64_t> variables_;
    std::unordered_map<std::string, support::SourceLoc> declaredAt_;
    int64_t nextVarAddr_;
    int64_t nextTempAddr_;
    int labelCounter_{100};
};

} // namespace pl0::frontend
