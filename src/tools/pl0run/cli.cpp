//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Parses pl0run command-line arguments into a RunnerConfig and picks the entry
// program once the source has been compiled.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include "usage.hpp"

#include "common/NumberParsing.hpp"
#include "support/diag_expected.hpp"

#include <iostream>
#include <map>
#include <string_view>

namespace pl0run
{

using namespace pl0;

namespace
{

std::optional<int64_t> parseInt(std::string_view text)
{
    auto parsed = common::number_parsing::parseDecimalLiteral(text);
    if (!parsed.valid || parsed.isFloat)
        return std::nullopt;
    return parsed.intValue;
}

std::optional<double> parseReal(std::string_view text)
{
    auto parsed = common::number_parsing::parseDecimalLiteral(text);
    if (!parsed.valid)
        return std::nullopt;
    return parsed.isFloat ? parsed.floatValue : static_cast<double>(parsed.intValue);
}

/// @brief Parse "a:0,b:32" into @p out.
bool parseBaseMap(std::string_view text, std::map<std::string, int64_t> &out)
{
    while (!text.empty())
    {
        const size_t comma = text.find(',');
        std::string_view item = text.substr(0, comma);
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);

        const size_t colon = item.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return false;
        auto base = parseInt(item.substr(colon + 1));
        if (!base)
            return false;
        out[std::string(item.substr(0, colon))] = *base;
    }
    return true;
}

/// @brief Parse "LO:HI" into an inclusive memory window.
std::optional<std::pair<int64_t, int64_t>> parseWindow(std::string_view text)
{
    const size_t colon = text.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;
    auto lo = parseInt(text.substr(0, colon));
    auto hi = parseInt(text.substr(colon + 1));
    if (!lo || !hi || *lo < 0 || *hi < *lo)
        return std::nullopt;
    return std::make_pair(*lo, *hi);
}

int usageError(std::string_view message)
{
    std::cerr << "error: " << message << "\n\n";
    printUsage();
    return kExitUsage;
}

} // namespace

std::optional<int> parseArgs(int argc, const char *const *argv, RunnerConfig &config)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        std::string_view value;
        if (const size_t eq = arg.find('='); arg.starts_with("--") && eq != std::string_view::npos)
        {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }

        if (arg == "-h" || arg == "--help")
        {
            printUsage();
            return kExitOk;
        }
        if (arg == "--version")
        {
            printVersion();
            return kExitOk;
        }

        if (arg == "--entry")
        {
            if (value.empty())
                return usageError("--entry requires a program name");
            config.entry = std::string(value);
        }
        else if (arg == "--fx-scale")
        {
            auto n = parseInt(value);
            if (!n || *n <= 0)
                return usageError("--fx-scale expects a positive integer");
            config.compile.fxScale = *n;
        }
        else if (arg == "--max-steps")
        {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return usageError("--max-steps expects a non-negative integer");
            config.run.maxSteps = static_cast<uint64_t>(*n);
        }
        else if (arg == "--base-step")
        {
            auto n = parseInt(value);
            if (!n || *n < 0)
                return usageError("--base-step expects a non-negative integer");
            config.layout.baseStep = *n;
        }
        else if (arg == "--base-map")
        {
            if (!parseBaseMap(value, config.layout.baseMap))
                return usageError("--base-map expects NAME:BASE[,NAME:BASE...]");
        }
        else if (arg == "--dump-asm")
        {
            config.dumpAsm = true;
        }
        else if (arg == "--dump-ast")
        {
            config.dumpAst = true;
        }
        else if (arg == "--dump-mem")
        {
            config.memWindow = parseWindow(value);
            if (!config.memWindow)
                return usageError("--dump-mem expects LO:HI");
        }
        else if (arg == "--trace")
        {
            config.run.trace.mode = vm::TraceConfig::Instr;
        }
        else if (arg == "--alu")
        {
            auto arch = provider::parseArithmeticArchitecture(value);
            if (!arch)
            {
                support::printDiag(arch.error(), std::cerr);
                return kExitUsage;
            }
            config.useAlu = true;
            config.alu.architecture = arch.value();
        }
        else if (arg == "--mix")
        {
            auto f = parseReal(value);
            if (!f || *f < 0.0 || *f > 1.0)
                return usageError("--mix expects a number in [0, 1]");
            config.alu.mix = *f;
        }
        else if (arg == "--fallback-abs")
        {
            auto f = parseReal(value);
            if (!f || *f < 0.0)
                return usageError("--fallback-abs expects a non-negative number");
            config.alu.fallbackAbsError = *f;
        }
        else if (arg == "--no-fallback")
        {
            config.alu.safetyFallback = false;
        }
        else if (arg == "--math")
        {
            auto arch = provider::parseMathArchitecture(value);
            if (!arch)
            {
                support::printDiag(arch.error(), std::cerr);
                return kExitUsage;
            }
            config.useMath = true;
            config.math.architecture = arch.value();
        }
        else if (arg == "--math-mix")
        {
            auto f = parseReal(value);
            if (!f || *f < 0.0 || *f > 1.0)
                return usageError("--math-mix expects a number in [0, 1]");
            config.math.mix = *f;
        }
        else if (arg == "--math-fallback-abs")
        {
            auto f = parseReal(value);
            if (!f || *f < 0.0)
                return usageError("--math-fallback-abs expects a non-negative number");
            config.math.fallbackAbsError = *f;
        }
        else if (arg == "--no-math-fallback")
        {
            config.math.safetyFallback = false;
        }
        else if (arg.starts_with("-"))
        {
            return usageError("unknown option: " + std::string(arg));
        }
        else
        {
            if (!config.sourcePath.empty())
                return usageError("multiple source files not supported");
            config.sourcePath = std::string(arg);
        }
    }

    if (config.sourcePath.empty())
        return usageError("no input file specified");
    return std::nullopt;
}

std::string selectEntry(const RunnerConfig &config, const frontend::MultiCompilerResult &compiled)
{
    if (!config.entry.empty() || compiled.programs.empty())
        return config.entry;
    return compiled.programs.back()->name;
}

} // namespace pl0run
