//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the program registry and label table construction.
//
//===----------------------------------------------------------------------===//

#include "bytecode/ProgramRegistry.hpp"

#include <algorithm>

namespace pl0::bytecode
{

LabelTable buildLabelTable(const std::vector<Instr> &code)
{
    LabelTable labels;
    for (size_t i = 0; i < code.size(); ++i)
    {
        const Instr &in = code[i];
        if (in.op == Opcode::LABEL && !in.operands.empty())
            labels[in.operands.front().symbol] = i;
    }
    return labels;
}

std::shared_ptr<const Program> ProgramRegistry::add(Program program)
{
    std::string name = program.name;
    auto stored = std::make_shared<const Program>(std::move(program));
    programs_[std::move(name)] = stored;
    return stored;
}

std::shared_ptr<const Program> ProgramRegistry::find(const std::string &name) const
{
    auto it = programs_.find(name);
    if (it == programs_.end())
        return nullptr;
    return it->second;
}

bool ProgramRegistry::contains(const std::string &name) const
{
    return programs_.count(name) != 0;
}

std::vector<std::string> ProgramRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(programs_.size());
    for (const auto &[name, program] : programs_)
        out.push_back(name);
    std::sort(out.begin(), out.end());
    return out;
}

void ProgramRegistry::clear()
{
    programs_.clear();
}

} // namespace pl0::bytecode
