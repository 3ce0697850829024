//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/pl0run/cli.hpp
// Purpose: Command-line model of pl0run: the parsed configuration, the
//          argument parser and entry selection.
// Key invariants: A RunnerConfig returned without an exit status names a
//                 source file; provider options are only used when the
//                 matching --alu/--math flag selected a provider.
// Ownership/Lifetime: RunnerConfig is a plain value; providers are created
//                     by main from its options.
// Links: src/tools/pl0run/main.cpp, src/tools/pl0run/usage.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontend/Compiler.hpp"
#include "frontend/CompilerOptions.hpp"
#include "provider/ArithmeticProvider.hpp"
#include "provider/MathProvider.hpp"
#include "vm/MachineConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace pl0run
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;

/// @brief Arithmetic provider options the runner starts from.
/// @details The safety fallback is on with the default threshold of 2 integer
///          units; --no-fallback turns it off and --fallback-abs moves it.
inline pl0::provider::ArithmeticProviderOptions runnerAluDefaults()
{
    pl0::provider::ArithmeticProviderOptions options;
    options.safetyFallback = true;
    return options;
}

/// @brief Configuration parsed from pl0run command-line arguments.
struct RunnerConfig
{
    std::string sourcePath;
    std::string entry;

    pl0::frontend::CompilerOptions compile{};
    pl0::frontend::ProgramLayout layout{};
    pl0::vm::RunConfig run{};

    bool dumpAsm = false;
    bool dumpAst = false;
    std::optional<std::pair<int64_t, int64_t>> memWindow;

    bool useAlu = false;
    pl0::provider::ArithmeticProviderOptions alu{runnerAluDefaults()};
    bool useMath = false;
    pl0::provider::MathProviderOptions math{};
};

/// @brief Parse the command line into @p config.
/// @details Options take the --name=value form. Usage errors are reported on
///          stderr together with the usage text.
/// @return std::nullopt to continue, or the exit status to return immediately.
std::optional<int> parseArgs(int argc, const char *const *argv, RunnerConfig &config);

/// @brief Program to run: --entry when given, otherwise the last unit compiled.
/// @details Callers must be declared after their callees, so the last unit is
///          the one that drives the others.
std::string selectEntry(const RunnerConfig &config,
                        const pl0::frontend::MultiCompilerResult &compiled);

} // namespace pl0run
