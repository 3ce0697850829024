//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and usage information for the pl0run command-line tool.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"
#include "pl0/version.hpp"
#include <iostream>

namespace pl0run
{

void printVersion()
{
    std::cout << "pl0run v" << PL0_VERSION_STR << "\n";
    std::cout << "PL/0 Compiler and Machine Runner\n";
}

void printUsage()
{
    std::cerr << "pl0run v" << PL0_VERSION_STR << " - PL/0 Program Runner\n"
              << "\n"
              << "Usage: pl0run [options] <file.pl0>\n"
              << "\n"
              << "Compilation:\n"
              << "  --entry=NAME                   Program to run (default: last in file)\n"
              << "  --fx-scale=N                   Fixed-point scale (default 65536)\n"
              << "  --base-step=N                  Base address step between programs (32)\n"
              << "  --base-map=a:0,b:32            Explicit base addresses by program\n"
              << "  --dump-asm                     Print the instruction listing\n"
              << "  --dump-ast                     Print the parsed program trees\n"
              << "\n"
              << "Execution:\n"
              << "  --max-steps=N                  Limit executed instructions\n"
              << "  --trace                        Trace every executed instruction\n"
              << "  --dump-mem=LO:HI               Print memory cells LO..HI after the run\n"
              << "\n"
              << "Arithmetic provider:\n"
              << "  --alu=linear                   Route ADD/SUB/MUL/DIV through a provider\n"
              << "  --mix=F                        Blend weight, 1 = prediction only\n"
              << "  --fallback-abs=F               Fallback threshold (default 2)\n"
              << "  --no-fallback                  Disable the arithmetic fallback\n"
              << "\n"
              << "Math provider:\n"
              << "  --math=table                   Route F* intrinsics through a provider\n"
              << "  --math-mix=F                   Blend weight in normalized space\n"
              << "  --math-fallback-abs=F          Fallback threshold (default 0.001)\n"
              << "  --no-math-fallback             Disable the math fallback\n"
              << "\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Exit status: 0 on halt, 1 on compile error or trap, 2 on usage error.\n";
}

} // namespace pl0run
