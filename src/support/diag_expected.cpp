//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the shared diagnostic construction and printing helpers, including
// the source excerpt with a caret under the reported column.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace pl0::support
{

namespace detail
{

/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Error:
            return "error";
    }
    return "";
}

} // namespace detail

Diag makeError(SourceLoc loc, std::string msg, std::string code)
{
    return Diag{Severity::Error, std::move(msg), loc, std::move(code)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a source manager is supplied and the location names a file,
///          the message is prefixed with "<path>:<line>:<column>:".  A stable
///          code, when present, follows the severity in brackets:
///          `error[P1004]: unknown variable 'x'`.  When @p sm holds the
///          source text, the offending line follows with a caret under the
///          reported column.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.isValid())
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.hasLine())
            {
                os << ':' << diag.loc.line;
                if (diag.loc.hasColumn())
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';

    if (!sm || !diag.loc.isValid())
        return;
    const std::string_view line = sm->getLine(diag.loc.file_id, diag.loc.line);
    if (line.empty())
        return;
    const size_t indent = diag.loc.hasColumn() ? diag.loc.column - 1 : 0;
    os << "  " << line << '\n' << "  " << std::string(indent, ' ') << "^\n";
}

} // namespace pl0::support
