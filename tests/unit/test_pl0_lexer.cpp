// File: tests/unit/test_pl0_lexer.cpp
// Purpose: Unit tests for PL/0 tokenization, literals, comments and lexical errors.
// Key invariants: Keywords match case-insensitively; lexical errors stop the
//                 token stream with an Error token and one diagnostic.
// Ownership/Lifetime: N/A (test).
// Links: src/frontend/Lexer.hpp

#include <gtest/gtest.h>

#include "frontend/Lexer.hpp"

#include <string>
#include <vector>

using namespace pl0::frontend;
using pl0::support::DiagnosticEngine;

namespace
{

std::vector<TokenKind> kindsOf(const std::vector<Token> &tokens)
{
    std::vector<TokenKind> kinds;
    for (const Token &t : tokens)
        kinds.push_back(t.kind);
    return kinds;
}

} // namespace

TEST(Pl0Lexer, ProgramHeaderAndDeclarations)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("program p; var x, y;", 1, diag);

    std::vector<TokenKind> expected = {TokenKind::KwProgram,
                                       TokenKind::Identifier,
                                       TokenKind::Semicolon,
                                       TokenKind::KwVar,
                                       TokenKind::Identifier,
                                       TokenKind::Comma,
                                       TokenKind::Identifier,
                                       TokenKind::Semicolon,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
    EXPECT_EQ(tokens[1].text, "p");
    EXPECT_EQ(diag.errorCount(), 0u);
}

TEST(Pl0Lexer, KeywordsAreCaseInsensitive)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("BEGIN While DO end", 0, diag);

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwBegin);
    EXPECT_EQ(tokens[1].kind, TokenKind::KwWhile);
    EXPECT_EQ(tokens[2].kind, TokenKind::KwDo);
    EXPECT_EQ(tokens[3].kind, TokenKind::KwEnd);
    EXPECT_EQ(tokens[0].text, "BEGIN");
}

TEST(Pl0Lexer, OperatorsAndPunctuation)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("x := (a + b) * c - d / e = f.", 0, diag);

    std::vector<TokenKind> expected = {TokenKind::Identifier, TokenKind::Assign,
                                       TokenKind::LParen,     TokenKind::Identifier,
                                       TokenKind::Plus,       TokenKind::Identifier,
                                       TokenKind::RParen,     TokenKind::Star,
                                       TokenKind::Identifier, TokenKind::Minus,
                                       TokenKind::Identifier, TokenKind::Slash,
                                       TokenKind::Identifier, TokenKind::Equal,
                                       TokenKind::Identifier, TokenKind::Dot,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
}

TEST(Pl0Lexer, IntegerAndRealLiterals)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("42 3.5 1e3 2.5e-1", 0, diag);

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntegerLiteral);
    EXPECT_EQ(tokens[0].intValue, 42);
    EXPECT_EQ(tokens[1].kind, TokenKind::RealLiteral);
    EXPECT_DOUBLE_EQ(tokens[1].realValue, 3.5);
    EXPECT_EQ(tokens[2].kind, TokenKind::RealLiteral);
    EXPECT_DOUBLE_EQ(tokens[2].realValue, 1000.0);
    EXPECT_EQ(tokens[3].kind, TokenKind::RealLiteral);
    EXPECT_DOUBLE_EQ(tokens[3].realValue, 0.25);
}

TEST(Pl0Lexer, TrailingDotAndBareExponentStayInteger)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("3. 2e", 0, diag);

    std::vector<TokenKind> expected = {TokenKind::IntegerLiteral,
                                       TokenKind::Dot,
                                       TokenKind::IntegerLiteral,
                                       TokenKind::Identifier,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf(tokens), expected);
    EXPECT_EQ(tokens[3].text, "e");
}

TEST(Pl0Lexer, LineCommentsAndPositions)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("// header\n  x\n", 3, diag);

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[0].loc.file_id, 3u);
    EXPECT_EQ(tokens[0].loc.line, 2u);
    EXPECT_EQ(tokens[0].loc.column, 3u);
    EXPECT_EQ(tokens[0].loc.offset, 12u);
}

TEST(Pl0Lexer, UnknownCharacterReportsOffset)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("x := 1 $", 0, diag);

    EXPECT_EQ(tokens.back().kind, TokenKind::Error);
    ASSERT_EQ(diag.errorCount(), 1u);
    const auto &d = diag.diagnostics().front();
    EXPECT_EQ(d.code, "P0001");
    EXPECT_NE(d.message.find("'$'"), std::string::npos);
    EXPECT_NE(d.message.find("offset 7"), std::string::npos);
}

TEST(Pl0Lexer, IntegerOutOfRange)
{
    DiagnosticEngine diag;
    auto tokens = tokenize("99999999999999999999", 0, diag);

    EXPECT_EQ(tokens.back().kind, TokenKind::Error);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics().front().code, "P0003");
}
