// File: tests/e2e/test_pl0_scenarios.cpp
// Purpose: End-to-end PL/0 runs from source text to final machine state.
// Scenarios:
//   1) Operator precedence: x := 2 + 3 * 4 stores 14
//   2) Matrix demo: setElement/getElement called through the data stack
//   3) Reference math: cos(0.0) and ln(1.0) at the default scale
//   4) Nested loops in caller and callee reuse the same label names
//
// Each scenario compiles with the default layout and runs without providers.

#include <gtest/gtest.h>

#include "bytecode/ProgramRegistry.hpp"
#include "frontend/Compiler.hpp"
#include "support/source_manager.hpp"
#include "vm/Machine.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace pl0;

namespace
{

constexpr const char *kMatrixDemo = R"(
program setElement;
var row, col, width, val, offset;
begin
  pop val;
  pop width;
  pop col;
  pop row;
  offset := row * width + col;
  offset := offset + 30;
  poke(offset, val);
end.

program getElement;
var row, col, width, offset, value;
begin
  pop width;
  pop col;
  pop row;
  offset := row * width + col;
  offset := offset + 30;
  peek(value, offset);
  push value;
end.

program matrixTest;
var width, row, col, val;
begin
  width := 4;
  row := 2;
  col := 3;
  val := 99;

  push row;
  push col;
  push width;
  push val;
  call setElement;

  push row;
  push col;
  push width;
  call getElement;
end.
)";

/// @brief Compile every unit of @p text into @p registry; reports diagnostics on failure.
bool compileInto(const std::string &text, bytecode::ProgramRegistry &registry)
{
    support::SourceManager sm;
    frontend::CompilerOptions options;
    auto result = frontend::compileAll(text, options, frontend::ProgramLayout{}, registry, sm);
    if (!result.succeeded())
    {
        std::ostringstream os;
        result.diagnostics.printAll(os, &sm);
        ADD_FAILURE() << os.str();
    }
    return result.succeeded();
}

} // namespace

TEST(Pl0Scenarios, PrecedenceStoresFourteen)
{
    bytecode::ProgramRegistry registry;
    ASSERT_TRUE(compileInto("program p; var x; begin x := 2 + 3 * 4; end.", registry));

    vm::Machine m(registry);
    ASSERT_EQ(m.run("p"), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[0], 14);
    EXPECT_EQ(m.registers()[0], 14);
}

TEST(Pl0Scenarios, MatrixDemoIsRepeatable)
{
    bytecode::ProgramRegistry registry;
    ASSERT_TRUE(compileInto(kMatrixDemo, registry));
    const std::vector<std::string> names = {"getElement", "matrixTest", "setElement"};
    ASSERT_EQ(registry.names(), names);

    vm::Machine m(registry);
    ASSERT_EQ(m.run("matrixTest"), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[41], 99);
    EXPECT_EQ(m.dataStack(), (std::vector<int64_t>{99}));
    EXPECT_EQ(m.callDepth(), 0u);
    EXPECT_EQ(m.currentProgram(), "matrixTest");

    // matrixTest is the third unit and lives at base 64.
    EXPECT_EQ(m.memory()[64], 4);
    EXPECT_EQ(m.memory()[67], 99);

    const std::vector<int64_t> memory = m.memory();
    const uint64_t steps = m.stats().steps;

    ASSERT_EQ(m.run("matrixTest"), vm::VMState::Halted);
    EXPECT_EQ(m.memory(), memory);
    EXPECT_EQ(m.dataStack(), (std::vector<int64_t>{99}));
    EXPECT_EQ(m.stats().steps, steps);
}

TEST(Pl0Scenarios, ReferenceMathAtDefaultScale)
{
    bytecode::ProgramRegistry registry;
    ASSERT_TRUE(compileInto("program mathTest;\n"
                            "var c, d, s;\n"
                            "begin\n"
                            "  c := cos(0.0);\n"
                            "  d := ln(1.0);\n"
                            "  s := sqrt(fx(16));\n"
                            "end.\n",
                            registry));

    vm::Machine m(registry);
    ASSERT_EQ(m.run("mathTest"), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[0], 65536);
    EXPECT_EQ(m.memory()[1], 0);
    EXPECT_EQ(m.memory()[2], 4 * 65536);
}

TEST(Pl0Scenarios, CalleeLabelsDoNotLeakIntoCaller)
{
    bytecode::ProgramRegistry registry;
    ASSERT_TRUE(compileInto("program inner; var k;\n"
                            "begin k := 2; while k do k := k - 1; end.\n"
                            "program outer; var n, c;\n"
                            "begin\n"
                            "  n := 3;\n"
                            "  c := 0;\n"
                            "  while n do\n"
                            "  begin\n"
                            "    call inner;\n"
                            "    n := n - 1;\n"
                            "    c := c + 1;\n"
                            "  end;\n"
                            "end.\n",
                            registry));

    vm::Machine m(registry);
    ASSERT_EQ(m.run("outer"), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[32], 0);
    EXPECT_EQ(m.memory()[33], 3);
    EXPECT_EQ(m.memory()[0], 0);
    EXPECT_EQ(m.currentProgram(), "outer");
}
