//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/NumberParsing.hpp
// Purpose: Decimal literal parsing for the lexer.
// Key invariants: Integer literals never exceed INT64_MAX; float literals are
//                 finite.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace pl0::common::number_parsing
{

/// @brief Result of parsing a numeric literal.
struct ParsedNumber
{
    bool isFloat = false;    ///< True if number has decimal point or exponent
    int64_t intValue = 0;    ///< Integer value (valid when !isFloat)
    double floatValue = 0.0; ///< Float value (valid when isFloat)
    bool overflow = false;   ///< True if value overflowed during parsing
    bool valid = true;       ///< True if parsing succeeded
};

/// @brief Parse a decimal numeric literal from text.
/// @param text Digits with an optional fraction and/or exponent.
/// @return ParsedNumber with the parsed value.
/// @details Handles formats like: 123, 123.45, 1.5e10, 2E-3
[[nodiscard]] inline ParsedNumber parseDecimalLiteral(std::string_view text)
{
    ParsedNumber result;
    if (text.empty())
    {
        result.valid = false;
        return result;
    }

    const bool hasDecimal = text.find('.') != std::string_view::npos;
    const bool hasExponent =
        text.find('e') != std::string_view::npos || text.find('E') != std::string_view::npos;
    result.isFloat = hasDecimal || hasExponent;

    if (result.isFloat)
    {
        // strtod for portability
        std::string textStr(text);
        char *endPtr = nullptr;
        result.floatValue = std::strtod(textStr.c_str(), &endPtr);
        if (endPtr != textStr.c_str() + textStr.size())
            result.valid = false;
        else if (!std::isfinite(result.floatValue))
        {
            result.overflow = true;
            result.valid = false;
        }
        return result;
    }

    auto parseResult = std::from_chars(text.data(), text.data() + text.size(), result.intValue);
    if (parseResult.ec == std::errc::result_out_of_range)
    {
        result.overflow = true;
        result.valid = false;
    }
    else if (parseResult.ec != std::errc{} || parseResult.ptr != text.data() + text.size())
    {
        result.valid = false;
    }
    return result;
}

} // namespace pl0::common::number_parsing
