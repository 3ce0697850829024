//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value; the stream is borrowed.
// Links: src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Instr.hpp"

#include <cstddef>
#include <ostream>
#include <string_view>

namespace pl0::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Instr, ///< One line per executed instruction
    } mode{Off};

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of @p in at @p ip of @p program.
    void onStep(std::string_view program, size_t ip, const bytecode::Instr &in);

    /// @brief Record a switch into @p callee from @p caller.
    void onEnter(std::string_view callee, std::string_view caller);

    /// @brief Record a return from @p callee back to @p caller.
    void onLeave(std::string_view callee, std::string_view caller);

  private:
    std::ostream &stream() const;

    TraceConfig cfg; ///< Active configuration
};

} // namespace pl0::vm
