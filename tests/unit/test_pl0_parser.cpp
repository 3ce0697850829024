// File: tests/unit/test_pl0_parser.cpp
// Purpose: Check the single-pass parser/code generator: emitted instruction
//          shapes, address and label allocation, and compile diagnostics.
// Key invariants: Variables are allocated upward from the base address,
//                 temporaries downward from memorySize - 2, labels count up
//                 from label_100; the first error aborts and nothing is
//                 registered.
// Ownership/Lifetime: Each test owns its registry and source manager.
// Links: src/frontend/Parser.hpp, src/frontend/Compiler.hpp

#include <gtest/gtest.h>

#include "bytecode/InstrText.hpp"
#include "bytecode/ProgramRegistry.hpp"
#include "frontend/AST.hpp"
#include "frontend/Compiler.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace pl0;
using namespace pl0::frontend;

namespace
{

struct CompileFixture : ::testing::Test
{
    bytecode::ProgramRegistry registry;
    support::SourceManager sm;
    CompilerOptions options;

    CompilerResult compile(const std::string &source)
    {
        return compilePl0(source, options, registry, sm);
    }

    std::vector<std::string> listing(const std::string &source)
    {
        auto result = compile(source);
        std::vector<std::string> lines;
        if (!result.succeeded())
        {
            std::ostringstream os;
            result.diagnostics.printAll(os, &sm);
            ADD_FAILURE() << os.str();
            return lines;
        }
        for (const auto &in : result.program->code)
            lines.push_back(bytecode::formatInstr(in));
        return lines;
    }

    std::string errorCode(const std::string &source)
    {
        auto result = compile(source);
        if (result.succeeded() || result.diagnostics.errorCount() == 0)
            return "<none>";
        return result.diagnostics.firstErrorCode();
    }
};

} // namespace

TEST_F(CompileFixture, PrecedenceAndTemporaries)
{
    std::vector<std::string> expected = {
        "LOAD r0, #2",
        "STORE r0, [253]",
        "LOAD r0, #3",
        "STORE r0, [254]",
        "LOAD r0, #4",
        "LOAD r1, [254]",
        "MUL r0, r1",
        "LOAD r1, [253]",
        "ADD r0, r1",
        "STORE r0, [0]",
        "RET",
    };
    EXPECT_EQ(listing("program p; var x; begin x := 2 + 3 * 4; end."), expected);
}

TEST_F(CompileFixture, WhileAllocatesLabelsBeforeCondition)
{
    std::vector<std::string> expected = {
        "LOAD r0, #3",
        "STORE r0, [0]",
        "label_100:",
        "LOAD r0, [0]",
        "JZ r0, label_101",
        "LOAD r0, [0]",
        "STORE r0, [254]",
        "LOAD r0, #1",
        "LOAD r1, [254]",
        "SUB r1, r0",
        "STORE r1, [254]",
        "LOAD r0, [254]",
        "STORE r0, [0]",
        "JMP label_100",
        "label_101:",
        "RET",
    };
    EXPECT_EQ(listing("program w; var i; begin i := 3; while i do i := i - 1; end."), expected);
}

TEST_F(CompileFixture, RecompilingGivesIdenticalCode)
{
    const std::string source = "program again; var i, s;\n"
                               "begin\n"
                               "  i := 3;\n"
                               "  s := 0;\n"
                               "  while i do\n"
                               "  begin\n"
                               "    if i - 2 then s := s + i * 2;\n"
                               "    i := i - 1;\n"
                               "  end;\n"
                               "end.";
    auto first = listing(source);
    auto second = listing(source);
    ASSERT_FALSE(first.empty());
    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i)
        EXPECT_EQ(first[i], second[i]) << "instruction " << i;
    EXPECT_EQ(first[4], "label_100:");

    // A second parser starts its labels and temporaries from scratch.
    auto precedence = listing("program p; var x; begin x := 2 + 3 * 4; end.");
    EXPECT_EQ(listing("program p; var x; begin x := 2 + 3 * 4; end."), precedence);
}

TEST_F(CompileFixture, IfLabelFollowsNestedLabels)
{
    auto lines = listing("program q; var x;\n"
                         "begin\n"
                         "  if x then while x do x := 0;\n"
                         "end.");
    std::vector<std::string> expected = {
        "LOAD r0, [0]",
        "JZ r0, label_102",
        "label_100:",
        "LOAD r0, [0]",
        "JZ r0, label_101",
        "LOAD r0, #0",
        "STORE r0, [0]",
        "JMP label_100",
        "label_101:",
        "label_102:",
        "RET",
    };
    EXPECT_EQ(lines, expected);
}

TEST_F(CompileFixture, StackAndMemoryStatements)
{
    std::vector<std::string> expected = {
        "LOAD r0, [0]",
        "PUSH r0",
        "POP r0",
        "STORE r0, [1]",
        "LOAD r0, [1]",
        "PEEK r1, [r0]",
        "STORE r1, [0]",
        "LOAD r0, [0]",
        "LOAD r1, [1]",
        "POKE r1, [r0]",
        "RET",
    };
    EXPECT_EQ(listing("program s; var a, b;\n"
                      "begin push a; pop b; peek(a, b); poke(a, b); end."),
              expected);
}

TEST_F(CompileFixture, BaseAddressOffsetsVariables)
{
    options.baseAddress = 20;
    auto lines = listing("program b; var u, v; begin v := u; end.");
    std::vector<std::string> expected = {"LOAD r0, [20]", "STORE r0, [21]", "RET"};
    EXPECT_EQ(lines, expected);
}

TEST_F(CompileFixture, RealLiteralsAndConstantsAreScaled)
{
    auto lines = listing("program f; var x; begin x := 1.5; x := PI; end.");
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines[0], "LOAD r0, #98304");
    EXPECT_EQ(lines[2], "LOAD r0, #205887");

    options.fxScale = 100;
    auto scaled = listing("program g; var x; begin x := 2.5; end.");
    ASSERT_FALSE(scaled.empty());
    EXPECT_EQ(scaled[0], "LOAD r0, #250");
}

TEST_F(CompileFixture, VariablesShadowConstants)
{
    auto lines = listing("program s; var e; begin e := e; end.");
    std::vector<std::string> expected = {"LOAD r0, [0]", "STORE r0, [0]", "RET"};
    EXPECT_EQ(lines, expected);
}

TEST_F(CompileFixture, IntrinsicsAndConversions)
{
    auto math = listing("program m; var x; begin x := Cos(0.0); x := log(x); end.");
    std::vector<std::string> expectedMath = {
        "LOAD r0, #0",
        "FCOS r0",
        "STORE r0, [0]",
        "LOAD r0, [0]",
        "FLOG10 r0",
        "STORE r0, [0]",
        "RET",
    };
    EXPECT_EQ(math, expectedMath);

    auto conv = listing("program c; var x, y; begin y := fx(x); y := int(y); end.");
    std::vector<std::string> expectedConv = {
        "LOAD r0, [0]",
        "STORE r0, [254]",
        "LOAD r0, #65536",
        "LOAD r1, [254]",
        "MUL r0, r1",
        "STORE r0, [1]",
        "LOAD r0, [1]",
        "LOAD r1, #65536",
        "DIV r0, r1",
        "STORE r0, [1]",
        "RET",
    };
    EXPECT_EQ(conv, expectedConv);
}

TEST_F(CompileFixture, CallsResolveAgainstRegistry)
{
    ASSERT_TRUE(compile("program callee; begin end.").succeeded());
    auto lines = listing("program caller; begin call callee; call caller; end.");
    std::vector<std::string> expected = {"PL0CALL callee", "PL0CALL caller", "RET"};
    EXPECT_EQ(lines, expected);
}

TEST_F(CompileFixture, EmptyBodyCompilesToReturn)
{
    auto lines = listing("program e; begin end.");
    std::vector<std::string> expected = {"RET"};
    EXPECT_EQ(lines, expected);
    EXPECT_TRUE(registry.contains("e"));
}

TEST_F(CompileFixture, AstDumpShowsStructure)
{
    auto result = compile("program p; var x; begin x := 2 + 3 * 4; end.");
    ASSERT_TRUE(result.succeeded());
    std::ostringstream os;
    dumpAst(*result.ast, os);
    const std::string expected = "program p\n"
                                 "  var x @0\n"
                                 "  begin\n"
                                 "    assign x @0\n"
                                 "      binary + tmp@253\n"
                                 "        number 2\n"
                                 "        binary * tmp@254\n"
                                 "          number 3\n"
                                 "          number 4\n"
                                 "  end\n";
    EXPECT_EQ(os.str(), expected);
}

TEST_F(CompileFixture, DiagnosticCodes)
{
    EXPECT_EQ(errorCode("program p; var x; begin x := 1 end."), "P1001");
    EXPECT_EQ(errorCode("program p; var x, x; begin end."), "P1002");
    EXPECT_EQ(errorCode("program p; begin y := 1; end."), "P1003");
    EXPECT_EQ(errorCode("program p; begin call nowhere; end."), "P1004");
    EXPECT_EQ(errorCode("program p; var x; begin x := foo(1); end."), "P1005");
    EXPECT_EQ(errorCode("program p; var x; begin x := ; end."), "P1006");
    EXPECT_EQ(errorCode("program p; begin end. extra"), "P1007");
    EXPECT_EQ(errorCode("program p; begin ) end."), "P1008");
    EXPECT_EQ(errorCode("program p; var x; begin x := 1 $ 2; end."), "P0001");
}

TEST_F(CompileFixture, DuplicateVariableNotesFirstDeclaration)
{
    options.path = "dup.pl0";
    auto result = compile("program d;\nvar a,\n    a;\nbegin end.");
    ASSERT_FALSE(result.succeeded());
    ASSERT_EQ(result.diagnostics.errorCount(), 1u);
    ASSERT_EQ(result.diagnostics.diagnostics().size(), 2u);

    const support::Diagnostic *err = result.diagnostics.firstError();
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->code, "P1002");
    EXPECT_EQ(err->loc.line, 3u);

    const auto &note = result.diagnostics.diagnostics().back();
    EXPECT_EQ(note.severity, support::Severity::Note);
    EXPECT_EQ(note.loc.line, 2u);
    EXPECT_EQ(note.loc.column, 5u);

    std::ostringstream os;
    result.diagnostics.printAll(os, &sm);
    EXPECT_NE(os.str().find("dup.pl0:3:5: error[P1002]"), std::string::npos);
    EXPECT_NE(os.str().find("dup.pl0:2:5: note[P1002]: previous declaration of 'a'"),
              std::string::npos);
}

TEST_F(CompileFixture, AddressLimits)
{
    options.baseAddress = 256;
    EXPECT_EQ(errorCode("program v; var x; begin end."), "P1009");

    options.baseAddress = 0;
    options.memorySize = 4;
    // Variables take 0..2 and the first temporary would be 2.
    EXPECT_EQ(errorCode("program t; var a, b, c; begin a := b + c; end."), "P1010");
}

TEST_F(CompileFixture, FailureRegistersNothingAndReportsPosition)
{
    options.path = "bad.pl0";
    auto result = compile("program bad;\nbegin\n  x := 1;\nend.");
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(registry.contains("bad"));
    ASSERT_EQ(result.diagnostics.errorCount(), 1u);
    const auto &d = result.diagnostics.diagnostics().front();
    EXPECT_EQ(d.code, "P1003");
    EXPECT_EQ(d.loc.line, 3u);
    EXPECT_EQ(d.loc.column, 3u);

    std::ostringstream os;
    result.diagnostics.printAll(os, &sm);
    EXPECT_NE(os.str().find("bad.pl0:3:3"), std::string::npos);
    EXPECT_NE(os.str().find("error[P1003]"), std::string::npos);
    EXPECT_NE(os.str().find("    x := 1;\n    ^\n"), std::string::npos);
}
