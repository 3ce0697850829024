//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic engine responsible for collecting messages emitted
// by the lexer and the parser/code generator.  Diagnostics are stored until the
// caller prints or inspects them.
//
//===----------------------------------------------------------------------===//

#include "diagnostics.hpp"

#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace pl0::support
{

/**
 * @brief Adds a diagnostic to the engine.
 *
 * Notes are stored in order but do not count as errors.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so file paths are resolved through
 * @p sm when one is supplied.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

const Diagnostic *DiagnosticEngine::firstError() const
{
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Error)
            return &d;
    }
    return nullptr;
}

std::string DiagnosticEngine::firstErrorCode() const
{
    const Diagnostic *d = firstError();
    return d ? d->code : std::string();
}

} // namespace pl0::support
