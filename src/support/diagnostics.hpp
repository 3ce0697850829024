//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic engine collecting P-coded compile errors
//          and the notes attached to them.
// Key invariants: errorCount() counts Error entries only; notes follow the
//                 error they explain.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace pl0::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
/// Compilation stops at the first error, so there is no warning level.
enum class Severity
{
    Note,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
    std::string code{};  ///< Stable diagnostic code (e.g. "P1003"); may be empty
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief First error in report order, or nullptr when none was reported.
    const Diagnostic *firstError() const;

    /// @brief Code of the first error, or an empty string.
    std::string firstErrorCode() const;

    /// @brief Access every recorded diagnostic in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
};

} // namespace pl0::support
