// File: tests/tools/test_pl0run_cli.cpp
// Purpose: Check pl0run argument parsing, provider defaults and entry selection.
// Key invariants: The arithmetic safety fallback is on at threshold 2 unless
//                 --no-fallback is given; --fallback-abs only moves the
//                 threshold; usage errors return exit status 2.
// Ownership/Lifetime: Each test owns its RunnerConfig and registry.
// Links: src/tools/pl0run/cli.hpp

#include <gtest/gtest.h>

#include "tools/pl0run/cli.hpp"

#include "bytecode/ProgramRegistry.hpp"
#include "support/source_manager.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace pl0;
using pl0run::RunnerConfig;

namespace
{

std::optional<int> parse(std::vector<const char *> args, RunnerConfig &config)
{
    args.insert(args.begin(), "pl0run");
    return pl0run::parseArgs(static_cast<int>(args.size()), args.data(), config);
}

} // namespace

TEST(Pl0RunCli, ArithmeticFallbackIsOnByDefault)
{
    RunnerConfig config;
    EXPECT_FALSE(parse({"prog.pl0", "--alu=linear"}, config).has_value());
    EXPECT_EQ(config.sourcePath, "prog.pl0");
    EXPECT_TRUE(config.useAlu);
    EXPECT_TRUE(config.alu.safetyFallback);
    EXPECT_DOUBLE_EQ(config.alu.fallbackAbsError, 2.0);
    EXPECT_TRUE(config.math.safetyFallback);
    EXPECT_FALSE(config.useMath);
}

TEST(Pl0RunCli, FallbackFlagsAdjustThresholdAndSwitch)
{
    RunnerConfig moved;
    EXPECT_FALSE(parse({"prog.pl0", "--fallback-abs=5"}, moved).has_value());
    EXPECT_TRUE(moved.alu.safetyFallback);
    EXPECT_DOUBLE_EQ(moved.alu.fallbackAbsError, 5.0);

    RunnerConfig off;
    EXPECT_FALSE(parse({"--no-fallback", "prog.pl0", "--no-math-fallback"}, off).has_value());
    EXPECT_FALSE(off.alu.safetyFallback);
    EXPECT_FALSE(off.math.safetyFallback);
}

TEST(Pl0RunCli, NumericOptionsReachTheirConfigs)
{
    RunnerConfig config;
    const std::optional<int> status = parse({"prog.pl0",
                                             "--fx-scale=100",
                                             "--max-steps=50",
                                             "--base-step=16",
                                             "--base-map=a:0,b:64",
                                             "--dump-mem=0:7",
                                             "--mix=0.25",
                                             "--entry=main"},
                                            config);
    EXPECT_FALSE(status.has_value());
    EXPECT_EQ(config.compile.fxScale, 100);
    EXPECT_EQ(config.run.maxSteps, 50u);
    EXPECT_EQ(config.layout.baseStep, 16);
    EXPECT_EQ(config.layout.baseMap.at("b"), 64);
    ASSERT_TRUE(config.memWindow.has_value());
    EXPECT_EQ(config.memWindow->second, 7);
    EXPECT_DOUBLE_EQ(config.alu.mix, 0.25);
    EXPECT_EQ(config.entry, "main");
}

TEST(Pl0RunCli, UsageErrorsReturnTwo)
{
    RunnerConfig none;
    EXPECT_EQ(parse({}, none), pl0run::kExitUsage);

    RunnerConfig unknown;
    EXPECT_EQ(parse({"prog.pl0", "--frobnicate"}, unknown), pl0run::kExitUsage);

    RunnerConfig badAbs;
    EXPECT_EQ(parse({"prog.pl0", "--fallback-abs=-1"}, badAbs), pl0run::kExitUsage);

    RunnerConfig badArch;
    EXPECT_EQ(parse({"prog.pl0", "--alu=quantum"}, badArch), pl0run::kExitUsage);

    RunnerConfig twoFiles;
    EXPECT_EQ(parse({"a.pl0", "b.pl0"}, twoFiles), pl0run::kExitUsage);

    RunnerConfig help;
    EXPECT_EQ(parse({"--help"}, help), pl0run::kExitOk);
}

TEST(Pl0RunCli, EntryDefaultsToLastUnit)
{
    bytecode::ProgramRegistry registry;
    support::SourceManager sm;
    auto compiled = frontend::compileAll("program helper; begin end.\n"
                                         "program driver; begin call helper; end.\n",
                                         frontend::CompilerOptions{},
                                         frontend::ProgramLayout{},
                                         registry,
                                         sm);
    ASSERT_TRUE(compiled.succeeded());

    RunnerConfig config;
    EXPECT_EQ(pl0run::selectEntry(config, compiled), "driver");

    config.entry = "helper";
    EXPECT_EQ(pl0run::selectEntry(config, compiled), "helper");
}
