//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/CharUtils.hpp
// Purpose: ASCII character classification shared by the lexer and the
//          instruction text assembler.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace pl0::common::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

/// @brief Check if character is ASCII whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

/// @brief Convert ASCII character to lowercase.
[[nodiscard]] constexpr char toLower(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>(c + ('a' - 'A'));
    return c;
}

/// @brief Convert ASCII character to uppercase.
[[nodiscard]] constexpr char toUpper(char c) noexcept
{
    if (c >= 'a' && c <= 'z')
        return static_cast<char>(c - ('a' - 'A'));
    return c;
}

/// @brief Convert string to lowercase (ASCII only).
[[nodiscard]] inline std::string toLowercase(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for (char c : s)
        result.push_back(toLower(c));
    return result;
}

/// @brief Convert string to uppercase (ASCII only).
[[nodiscard]] inline std::string toUppercase(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for (char c : s)
        result.push_back(toUpper(c));
    return result;
}

/// @brief Strip leading and trailing ASCII whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept
{
    while (!s.empty() && isWhitespace(s.front()))
        s.remove_prefix(1);
    while (!s.empty() && isWhitespace(s.back()))
        s.remove_suffix(1);
    return s;
}

} // namespace pl0::common::char_utils
