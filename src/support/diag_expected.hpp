//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic by value.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace pl0::support
{

using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors the subset of std::expected the assembler, the program
///       splitter and the tools rely on.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @param value Value produced by a successful computation.
    /// @details Disabled for arguments that decay to Diag so the diagnostic
    ///          constructor below is selected for errors.
    template <class U = T, class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic to return to the caller.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with location and message.
/// @param loc Optional source location associated with the diagnostic.
/// @param msg Human-readable diagnostic message.
/// @param code Optional stable diagnostic code.
/// @return Diagnostic marked as an error severity.
Diag makeError(SourceLoc loc, std::string msg, std::string code = {});

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @param sm Optional source manager to resolve file paths.
/// @note Follows DiagnosticEngine::printAll formatting for consistency.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace pl0::support
