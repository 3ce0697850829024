//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: vm/Trace.cpp
// Purpose: Emit instruction and program-switch trace lines.
// Key invariants: Every line starts with "[PL0] " and ends with a newline.
// Ownership/Lifetime: Borrowed stream must outlive the sink.
// Links: src/vm/Trace.hpp
//
//===----------------------------------------------------------------------===//

#include "vm/Trace.hpp"

#include "bytecode/InstrText.hpp"

#include <iostream>

namespace pl0::vm
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

std::ostream &TraceSink::stream() const
{
    return cfg.out ? *cfg.out : std::cerr;
}

void TraceSink::onStep(std::string_view program, size_t ip, const bytecode::Instr &in)
{
    if (!cfg.enabled())
        return;
    stream() << "[PL0] prog=" << program << " ip=#" << ip << " op=" << bytecode::formatInstr(in)
             << '\n';
}

void TraceSink::onEnter(std::string_view callee, std::string_view caller)
{
    if (!cfg.enabled())
        return;
    stream() << "[PL0] enter prog=" << callee << " from=" << caller << '\n';
}

void TraceSink::onLeave(std::string_view callee, std::string_view caller)
{
    if (!cfg.enabled())
        return;
    stream() << "[PL0] leave prog=" << callee << " to=" << caller << '\n';
}

} // namespace pl0::vm
