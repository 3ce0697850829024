//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the provider statistics report printed by pl0run.
//
//===----------------------------------------------------------------------===//

#include "vm/RunStats.hpp"

namespace pl0::vm
{

namespace
{

void printOp(std::ostream &os, const char *name, const OpStats &s)
{
    if (s.calls == 0)
        return;
    os << "  " << name << ": calls=" << s.calls << " fallbacks=" << s.fallbacks
       << " meanAbsError=" << s.absErrorSum / static_cast<double>(s.calls) << '\n';
}

} // namespace

void printRunStats(const RunStats &stats, std::ostream &os)
{
    os << "steps: " << stats.steps << '\n';
    for (size_t i = 0; i < provider::kArithOpCount; ++i)
    {
        const auto op = static_cast<provider::ArithOp>(i);
        printOp(os, provider::arithOpName(op), stats.of(op));
    }
    for (common::MathOp op : common::kAllMathOps)
        printOp(os, common::mathOpName(op), stats.of(op));
}

} // namespace pl0::vm
