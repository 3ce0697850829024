//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Lexer.hpp
// Purpose: Declares the lexer for the PL/0 dialect.
// Key invariants: Keywords are case-insensitive; identifiers keep their case;
//                 line/column/offset tracking for every token.
// Ownership/Lifetime: Lexer owns a copy of the source; DiagnosticEngine borrowed.
// Links: src/frontend/Parser.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pl0::frontend
{

/// @brief All token kinds recognized by the lexer.
enum class TokenKind
{
    // Markers
    Eof,   ///< End of input
    Error, ///< Lexical error (unknown character, bad literal)

    // Literals
    IntegerLiteral, ///< Unscaled integer
    RealLiteral,    ///< Literal with a fraction or exponent (not yet scaled)

    // Identifiers
    Identifier,

    // Keywords
    KwBegin,
    KwCall,
    KwDo,
    KwEnd,
    KwIf,
    KwOdd,
    KwPeek,
    KwPoke,
    KwPop,
    KwProgram,
    KwPush,
    KwThen,
    KwVar,
    KwWhile,

    // Operators
    Plus,   ///< +
    Minus,  ///< -
    Star,   ///< *
    Slash,  ///< /
    Equal,  ///< =
    Assign, ///< :=

    // Punctuation
    Dot,       ///< .
    Comma,     ///< ,
    Semicolon, ///< ;
    LParen,    ///< (
    RParen,    ///< )
};

/// @brief Convert TokenKind to human-readable string.
const char *tokenKindToString(TokenKind kind);

/// @brief Whether @p kind is one of the reserved words.
bool isKeyword(TokenKind kind);

/// @brief A lexical token.
struct Token
{
    /// @brief Classification of this token.
    TokenKind kind{TokenKind::Eof};

    /// @brief Original spelling of the token in source.
    std::string text;

    /// @brief Parsed value for IntegerLiteral tokens.
    int64_t intValue{0};

    /// @brief Parsed value for RealLiteral tokens.
    double realValue{0.0};

    /// @brief Source location where the token begins.
    support::SourceLoc loc;
};

/// @brief Tokenizes PL/0 source text.
/// @details Call next() until Eof is returned.  Line comments (`//`) are
///          skipped.  The first lexical error produces an Error token and a
///          diagnostic (code P0001-P0003).
/// @invariant The lexer looks at most two characters past the current one.
class Lexer
{
  public:
    /// @brief Create a lexer over the given source buffer.
    /// @param source Source text to tokenize.
    /// @param fileId Identifier of the source buffer for diagnostics.
    /// @param diag Diagnostic engine for reporting errors.
    Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag);

    /// @brief Produce the next token in the source.
    /// @return The next lexical token, or an Eof token when no characters remain.
    Token next();

  private:
    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;

    /// @brief Skip whitespace and `//` line comments.
    void skipWhitespaceAndComments();

    support::SourceLoc currentLoc() const;

    /// @brief Lex an integer or real literal.
    Token lexNumber();

    /// @brief Lex an identifier or keyword.
    Token lexIdentifierOrKeyword();

    void reportError(support::SourceLoc loc, const std::string &message, const char *code);

    /// @brief Lookup a lowercase identifier in the keyword table.
    static std::optional<TokenKind> lookupKeyword(std::string_view canonical);

    std::string source_;                ///< Source code being tokenized.
    size_t pos_{0};                     ///< Current index into source.
    uint32_t fileId_;                   ///< File identifier for locations.
    uint32_t line_{1};                  ///< 1-based line number.
    uint32_t column_{1};                ///< 1-based column number.
    support::DiagnosticEngine &diag_;   ///< Diagnostic engine for errors.
};

/// @brief Tokenize the whole of @p source.
/// @return Every token up to and including the terminating Eof or Error token.
std::vector<Token> tokenize(std::string source, uint32_t fileId, support::DiagnosticEngine &diag);

} // namespace pl0::frontend
