//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the pl0run command-line tool.
// Compiles every program in a PL/0 source file, runs one of them on the
// machine and prints the final register, stack and memory state.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the pl0run tool.
/// @details pl0run file.pl0 compiles each `program` unit in the file into the
///          registry, then runs the entry program (the last one unless
///          --entry is given) with the requested providers attached.

#include "cli.hpp"

#include "bytecode/InstrText.hpp"
#include "bytecode/ProgramRegistry.hpp"
#include "frontend/AST.hpp"
#include "frontend/Compiler.hpp"
#include "provider/ArithmeticProvider.hpp"
#include "provider/MathProvider.hpp"
#include "support/source_manager.hpp"
#include "vm/Machine.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace
{

using namespace pl0;
using pl0run::RunnerConfig;

void printState(const vm::Machine &machine, const RunnerConfig &config, std::ostream &os)
{
    os << "registers:";
    for (size_t i = 0; i < machine.registers().size(); ++i)
        os << " r" << i << '=' << machine.registers()[i];
    os << '\n';

    os << "stack: [";
    const auto &stack = machine.dataStack();
    for (size_t i = 0; i < stack.size(); ++i)
        os << (i ? ", " : "") << stack[i];
    os << "]\n";

    if (config.memWindow)
    {
        const auto &mem = machine.memory();
        const auto [lo, hi] = *config.memWindow;
        for (int64_t a = lo; a <= hi && static_cast<size_t>(a) < mem.size(); ++a)
            os << "mem[" << a << "] = " << mem[static_cast<size_t>(a)] << '\n';
    }
}

} // namespace

/// @brief Main entry point for pl0run.
/// @return 0 on halt, 1 on compile error or trap, 2 on usage error.
int main(int argc, char **argv)
{
    RunnerConfig config;
    if (auto exitCode = pl0run::parseArgs(argc, argv, config))
        return *exitCode;

    std::ifstream in(config.sourcePath, std::ios::binary);
    if (!in)
    {
        std::cerr << "error: cannot open " << config.sourcePath << "\n";
        return pl0run::kExitFailure;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string source = buffer.str();

    support::SourceManager sm;
    bytecode::ProgramRegistry registry;
    config.compile.path = config.sourcePath;
    config.alu.scale = config.compile.fxScale;
    config.math.scale = config.compile.fxScale;

    auto compiled = frontend::compileAll(source, config.compile, config.layout, registry, sm);
    if (!compiled.succeeded())
    {
        compiled.diagnostics.printAll(std::cerr, &sm);
        return pl0run::kExitFailure;
    }

    if (config.dumpAst)
    {
        for (const auto &ast : compiled.asts)
            frontend::dumpAst(*ast, std::cout);
    }
    if (config.dumpAsm)
    {
        for (const auto &program : compiled.programs)
            bytecode::disassemble(*program, std::cout);
    }

    const std::string entry = pl0run::selectEntry(config, compiled);

    std::unique_ptr<provider::ArithmeticProvider> alu;
    if (config.useAlu)
    {
        alu = provider::makeArithmeticProvider(config.alu);
        config.run.arithmetic = alu.get();
    }
    std::unique_ptr<provider::MathProvider> math;
    if (config.useMath)
    {
        math = provider::makeMathProvider(config.math);
        config.run.math = math.get();
    }

    vm::MachineConfig machineConfig;
    machineConfig.memorySize = config.compile.memorySize;
    machineConfig.fxScale = config.compile.fxScale;
    vm::Machine machine(registry, machineConfig);

    const vm::VMState state = machine.run(entry, config.run);

    printState(machine, config, std::cout);
    if (config.useAlu || config.useMath)
        vm::printRunStats(machine.stats(), std::cout);
    else
        std::cout << "steps: " << machine.stats().steps << '\n';

    if (state == vm::VMState::Trapped)
    {
        std::cerr << vm::formatTrap(*machine.trap()) << '\n';
        return pl0run::kExitFailure;
    }
    return pl0run::kExitOk;
}
