//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontend/Lexer.cpp
// Purpose: Implements the PL/0 lexer.
// Key invariants: Case-insensitive keywords; line/column/offset tracking.
// Ownership/Lifetime: Lexer owns copy of source; DiagnosticEngine borrowed.
// Links: src/frontend/Lexer.hpp
//
//===----------------------------------------------------------------------===//

#include "frontend/Lexer.hpp"

#include "common/CharUtils.hpp"
#include "common/NumberParsing.hpp"

#include <algorithm>
#include <array>

namespace pl0::frontend
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "end of input";
        case TokenKind::Error:
            return "error";
        case TokenKind::IntegerLiteral:
            return "integer";
        case TokenKind::RealLiteral:
            return "real";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwBegin:
            return "begin";
        case TokenKind::KwCall:
            return "call";
        case TokenKind::KwDo:
            return "do";
        case TokenKind::KwEnd:
            return "end";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwOdd:
            return "odd";
        case TokenKind::KwPeek:
            return "peek";
        case TokenKind::KwPoke:
            return "poke";
        case TokenKind::KwPop:
            return "pop";
        case TokenKind::KwProgram:
            return "program";
        case TokenKind::KwPush:
            return "push";
        case TokenKind::KwThen:
            return "then";
        case TokenKind::KwVar:
            return "var";
        case TokenKind::KwWhile:
            return "while";
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Equal:
            return "=";
        case TokenKind::Assign:
            return ":=";
        case TokenKind::Dot:
            return ".";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Semicolon:
            return ";";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
    }
    return "unknown";
}

bool isKeyword(TokenKind kind)
{
    return kind >= TokenKind::KwBegin && kind <= TokenKind::KwWhile;
}

//===----------------------------------------------------------------------===//
// Keyword table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by key for binary search.
constexpr std::array<KeywordEntry, 14> kKeywordTable = {{
    {"begin", TokenKind::KwBegin},
    {"call", TokenKind::KwCall},
    {"do", TokenKind::KwDo},
    {"end", TokenKind::KwEnd},
    {"if", TokenKind::KwIf},
    {"odd", TokenKind::KwOdd},
    {"peek", TokenKind::KwPeek},
    {"poke", TokenKind::KwPoke},
    {"pop", TokenKind::KwPop},
    {"program", TokenKind::KwProgram},
    {"push", TokenKind::KwPush},
    {"then", TokenKind::KwThen},
    {"var", TokenKind::KwVar},
    {"while", TokenKind::KwWhile},
}};

using ::pl0::common::char_utils::isDigit;
using ::pl0::common::char_utils::isIdentifierContinue;
using ::pl0::common::char_utils::isLetter;
using ::pl0::common::char_utils::isWhitespace;
using ::pl0::common::char_utils::toLowercase;

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

support::SourceLoc Lexer::currentLoc() const
{
    return support::SourceLoc{fileId_, line_, column_, static_cast<uint32_t>(pos_)};
}

void Lexer::reportError(support::SourceLoc loc, const std::string &message, const char *code)
{
    diag_.report(support::Diagnostic{support::Severity::Error, message, loc, code});
}

void Lexer::skipWhitespaceAndComments()
{
    while (!eof())
    {
        char c = peekChar();

        if (isWhitespace(c))
        {
            getChar();
            continue;
        }

        // Line comment: //
        if (c == '/' && peekChar(1) == '/')
        {
            while (!eof() && peekChar() != '\n')
                getChar();
            continue;
        }

        break;
    }
}

std::optional<TokenKind> Lexer::lookupKeyword(std::string_view canonical)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               canonical,
                               [](const KeywordEntry &entry, std::string_view key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == canonical)
        return it->kind;
    return std::nullopt;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();

    while (!eof() && isIdentifierContinue(peekChar()))
        tok.text.push_back(getChar());

    if (auto kw = lookupKeyword(toLowercase(tok.text)))
    {
        tok.kind = *kw;
        return tok;
    }
    tok.kind = TokenKind::Identifier;
    return tok;
}

/// @brief Lex an integer or real literal.
///
/// @details A fraction is only consumed when a digit follows the '.', so
///          `3.` lexes as the integer 3 followed by a Dot.  An exponent is only
///          consumed when a digit (optionally after a sign) follows the 'e', so
///          `2e` lexes as the integer 2 followed by the identifier `e`.
Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::IntegerLiteral;

    while (!eof() && isDigit(peekChar()))
        tok.text.push_back(getChar());

    if (peekChar() == '.' && isDigit(peekChar(1)))
    {
        tok.kind = TokenKind::RealLiteral;
        tok.text.push_back(getChar()); // '.'
        while (!eof() && isDigit(peekChar()))
            tok.text.push_back(getChar());
    }

    const char e = peekChar();
    if (e == 'e' || e == 'E')
    {
        const char s = peekChar(1);
        const bool signedExp = (s == '+' || s == '-') && isDigit(peekChar(2));
        if (isDigit(s) || signedExp)
        {
            tok.kind = TokenKind::RealLiteral;
            tok.text.push_back(getChar()); // 'e'
            if (signedExp)
                tok.text.push_back(getChar());
            while (!eof() && isDigit(peekChar()))
                tok.text.push_back(getChar());
        }
    }

    auto parsed = common::number_parsing::parseDecimalLiteral(tok.text);
    if (!parsed.valid)
    {
        if (tok.kind == TokenKind::RealLiteral)
            reportError(tok.loc, "bad float literal: " + tok.text, "P0002");
        else
            reportError(tok.loc, "integer literal out of range: " + tok.text, "P0003");
        tok.kind = TokenKind::Error;
        return tok;
    }
    if (tok.kind == TokenKind::RealLiteral)
        tok.realValue = parsed.floatValue;
    else
        tok.intValue = parsed.intValue;
    return tok;
}

Token Lexer::next()
{
    skipWhitespaceAndComments();

    if (eof())
    {
        Token tok;
        tok.kind = TokenKind::Eof;
        tok.loc = currentLoc();
        return tok;
    }

    const char c = peekChar();

    if (isLetter(c))
        return lexIdentifierOrKeyword();

    if (isDigit(c))
        return lexNumber();

    Token tok;
    tok.loc = currentLoc();

    // ':=' is the only two-character symbol.
    if (c == ':' && peekChar(1) == '=')
    {
        getChar();
        getChar();
        tok.kind = TokenKind::Assign;
        tok.text = ":=";
        return tok;
    }

    switch (c)
    {
        case '+':
            tok.kind = TokenKind::Plus;
            break;
        case '-':
            tok.kind = TokenKind::Minus;
            break;
        case '*':
            tok.kind = TokenKind::Star;
            break;
        case '/':
            tok.kind = TokenKind::Slash;
            break;
        case '=':
            tok.kind = TokenKind::Equal;
            break;
        case '.':
            tok.kind = TokenKind::Dot;
            break;
        case ',':
            tok.kind = TokenKind::Comma;
            break;
        case ';':
            tok.kind = TokenKind::Semicolon;
            break;
        case '(':
            tok.kind = TokenKind::LParen;
            break;
        case ')':
            tok.kind = TokenKind::RParen;
            break;
        default:
            reportError(tok.loc,
                        std::string("unknown character '") + c + "' at offset " +
                            std::to_string(pos_),
                        "P0001");
            tok.kind = TokenKind::Error;
            tok.text = std::string(1, c);
            getChar();
            return tok;
    }
    tok.text = std::string(1, getChar());
    return tok;
}

std::vector<Token> tokenize(std::string source, uint32_t fileId, support::DiagnosticEngine &diag)
{
    Lexer lexer(std::move(source), fileId, diag);
    std::vector<Token> tokens;
    while (true)
    {
        tokens.push_back(lexer.next());
        const TokenKind kind = tokens.back().kind;
        if (kind == TokenKind::Eof || kind == TokenKind::Error)
            break;
    }
    return tokens;
}

} // namespace pl0::frontend
