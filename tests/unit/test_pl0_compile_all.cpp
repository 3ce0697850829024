// File: tests/unit/test_pl0_compile_all.cpp
// Purpose: Cover multi-program files: unit extraction, base-address layout
//          and file-relative diagnostics.
// Key invariants: Units compile in source order; an unmapped unit is based
//                 baseStep after its predecessor; the first failure stops.
// Ownership/Lifetime: Each test owns its registry and source manager.
// Links: src/frontend/Compiler.hpp

#include <gtest/gtest.h>

#include "bytecode/InstrText.hpp"
#include "bytecode/ProgramRegistry.hpp"
#include "frontend/Compiler.hpp"
#include "support/source_manager.hpp"

#include <string>

using namespace pl0;
using namespace pl0::frontend;

namespace
{

constexpr const char *kThreePrograms = "program first; var a; begin a := 1; end.\n"
                                       "// second unit\n"
                                       "program second; var b; begin b := 2; end.\n"
                                       "program third; var c; begin call first; end.\n";

} // namespace

TEST(Pl0CompileAll, SplitFindsUnitsInOrder)
{
    auto units = splitPrograms(kThreePrograms);
    ASSERT_TRUE(units.hasValue());
    ASSERT_EQ(units.value().size(), 3u);
    EXPECT_EQ(units.value()[0].name, "first");
    EXPECT_EQ(units.value()[1].name, "second");
    EXPECT_EQ(units.value()[2].name, "third");
    EXPECT_EQ(units.value()[0].offset, 0u);
    EXPECT_EQ(units.value()[1].text.rfind("program second", 0), 0u);
}

TEST(Pl0CompileAll, SplitWithoutProgramIsAnError)
{
    auto units = splitPrograms("var x; begin end.");
    ASSERT_FALSE(units.hasValue());
    EXPECT_EQ(units.error().code, "P1011");

    auto lexBad = splitPrograms("program p; $");
    ASSERT_FALSE(lexBad.hasValue());
    EXPECT_EQ(lexBad.error().code, "P0001");
}

TEST(Pl0CompileAll, UnitsGetConsecutiveBases)
{
    bytecode::ProgramRegistry registry;
    support::SourceManager sm;
    CompilerOptions options;
    ProgramLayout layout;

    auto result = compileAll(kThreePrograms, options, layout, registry, sm);
    ASSERT_TRUE(result.succeeded());
    ASSERT_EQ(result.programs.size(), 3u);
    ASSERT_EQ(result.asts.size(), 3u);

    EXPECT_EQ(bytecode::formatInstr(registry.find("first")->code[1]), "STORE r0, [0]");
    EXPECT_EQ(bytecode::formatInstr(registry.find("second")->code[1]), "STORE r0, [32]");
    EXPECT_EQ(result.asts[2]->block.vars[0].address, 64);
}

TEST(Pl0CompileAll, BaseMapOverridesAndChains)
{
    bytecode::ProgramRegistry registry;
    support::SourceManager sm;
    CompilerOptions options;
    ProgramLayout layout;
    layout.baseStep = 10;
    layout.baseMap["second"] = 100;

    auto result = compileAll(kThreePrograms, options, layout, registry, sm);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.asts[0]->block.vars[0].address, 0);
    EXPECT_EQ(result.asts[1]->block.vars[0].address, 100);
    EXPECT_EQ(result.asts[2]->block.vars[0].address, 110);
}

TEST(Pl0CompileAll, StopsAtFirstFailureWithFilePosition)
{
    bytecode::ProgramRegistry registry;
    support::SourceManager sm;
    CompilerOptions options;
    options.path = "multi.pl0";

    const std::string text = "program ok; begin end.\n"
                             "program broken; begin y := 1; end.\n"
                             "program never; begin end.\n";
    auto result = compileAll(text, options, ProgramLayout{}, registry, sm);

    EXPECT_FALSE(result.succeeded());
    EXPECT_TRUE(registry.contains("ok"));
    EXPECT_FALSE(registry.contains("broken"));
    EXPECT_FALSE(registry.contains("never"));
    ASSERT_EQ(result.diagnostics.errorCount(), 1u);
    const auto &d = result.diagnostics.diagnostics().front();
    EXPECT_EQ(d.code, "P1003");
    EXPECT_EQ(d.loc.line, 2u);
    EXPECT_EQ(d.loc.column, 23u);
}
