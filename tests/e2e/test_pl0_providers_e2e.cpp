// File: tests/e2e/test_pl0_providers_e2e.cpp
// Purpose: Run compiled PL/0 programs with arithmetic and math providers attached.
// Scenarios:
//   1) Saturating linear arithmetic provider, with and without the safety fallback
//   2) Table math provider falling back to the reference for ln(1.0)
//   3) Provider exceptions and out-of-range results become ProviderError traps
//
// Providers are borrowed by the machine through RunConfig for one run.

#include <gtest/gtest.h>

#include "bytecode/ProgramRegistry.hpp"
#include "common/FixedPoint.hpp"
#include "frontend/Compiler.hpp"
#include "provider/ArithmeticProvider.hpp"
#include "provider/MathProvider.hpp"
#include "support/source_manager.hpp"
#include "vm/Machine.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace pl0;
using provider::ArithOp;
using common::MathOp;

namespace
{

void compileOrFail(const std::string &source, bytecode::ProgramRegistry &registry)
{
    support::SourceManager sm;
    auto result = frontend::compilePl0(source, frontend::CompilerOptions{}, registry, sm);
    if (!result.succeeded())
    {
        std::ostringstream os;
        result.diagnostics.printAll(os, &sm);
        ADD_FAILURE() << os.str();
    }
}

class ThrowingArithmetic final : public provider::ArithmeticProvider
{
  public:
    provider::ArithmeticResult compute(ArithOp, int64_t, int64_t) override
    {
        throw std::runtime_error("sensor offline");
    }
};

/// Returns a value no fixed-point register may hold.
class OverflowingMath final : public provider::MathProvider
{
  public:
    provider::MathResult compute(MathOp, int64_t) override
    {
        provider::MathResult r;
        r.result = common::fixed::kMaxEncoded + 1;
        return r;
    }
};

} // namespace

TEST(Pl0ProvidersE2E, ArithmeticProviderSaturatesUnlessGuarded)
{
    bytecode::ProgramRegistry registry;
    compileOrFail("program sum; var x; begin x := 60000 + 60000; end.", registry);

    provider::ArithmeticProviderOptions options;
    auto alu = provider::makeArithmeticProvider(options);
    vm::RunConfig cfg;
    cfg.arithmetic = alu.get();

    vm::Machine m(registry);
    ASSERT_EQ(m.run("sum", cfg), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[0], 65536);
    const vm::OpStats &add = m.stats().of(ArithOp::Add);
    EXPECT_EQ(add.calls, 1u);
    EXPECT_EQ(add.fallbacks, 0u);
    EXPECT_DOUBLE_EQ(add.absErrorSum, 54464.0);

    options.safetyFallback = true;
    auto guarded = provider::makeArithmeticProvider(options);
    cfg.arithmetic = guarded.get();
    ASSERT_EQ(m.run("sum", cfg), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[0], 120000);
    EXPECT_EQ(m.stats().of(ArithOp::Add).fallbacks, 1u);

    // Without a provider the same program is exact and records no provider calls.
    ASSERT_EQ(m.run("sum"), vm::VMState::Halted);
    EXPECT_EQ(m.memory()[0], 120000);
    EXPECT_EQ(m.stats().of(ArithOp::Add).calls, 0u);
}

TEST(Pl0ProvidersE2E, MathProviderFallsBackToReference)
{
    bytecode::ProgramRegistry registry;
    compileOrFail("program m; var c, d; begin c := cos(0.0); d := ln(1.0); end.", registry);

    auto fpu = provider::makeMathProvider(provider::MathProviderOptions{});
    vm::RunConfig cfg;
    cfg.math = fpu.get();

    vm::Machine m(registry);
    ASSERT_EQ(m.run("m", cfg), vm::VMState::Halted);
    EXPECT_NEAR(static_cast<double>(m.memory()[0]), 65536.0, 100.0);
    EXPECT_EQ(m.memory()[1], 0);

    EXPECT_EQ(m.stats().of(MathOp::Cos).calls, 1u);
    EXPECT_EQ(m.stats().of(MathOp::Cos).fallbacks, 0u);
    EXPECT_EQ(m.stats().of(MathOp::Ln).calls, 1u);
    EXPECT_EQ(m.stats().of(MathOp::Ln).fallbacks, 1u);

    cfg.trackStats = false;
    ASSERT_EQ(m.run("m", cfg), vm::VMState::Halted);
    EXPECT_EQ(m.stats().of(MathOp::Ln).calls, 0u);
}

TEST(Pl0ProvidersE2E, ProviderExceptionTraps)
{
    bytecode::ProgramRegistry registry;
    compileOrFail("program p; var x; begin x := 1; x := x * 2; end.", registry);

    ThrowingArithmetic alu;
    vm::RunConfig cfg;
    cfg.arithmetic = &alu;

    vm::Machine m(registry);
    ASSERT_EQ(m.run("p", cfg), vm::VMState::Trapped);
    ASSERT_TRUE(m.trap().has_value());
    EXPECT_EQ(m.trap()->kind, vm::TrapKind::ProviderError);
    EXPECT_NE(m.trap()->message.find("MUL"), std::string::npos);
    EXPECT_NE(m.trap()->message.find("sensor offline"), std::string::npos);
    EXPECT_EQ(m.trap()->instruction, "MUL r0, r1");
    EXPECT_EQ(m.memory()[0], 1);
}

TEST(Pl0ProvidersE2E, OutOfRangeMathResultTraps)
{
    bytecode::ProgramRegistry registry;
    compileOrFail("program q; var x; begin x := sin(1.0); end.", registry);

    OverflowingMath fpu;
    vm::RunConfig cfg;
    cfg.math = &fpu;

    vm::Machine m(registry);
    ASSERT_EQ(m.run("q", cfg), vm::VMState::Trapped);
    EXPECT_EQ(m.trap()->kind, vm::TrapKind::ProviderError);
    EXPECT_NE(m.trap()->message.find("out-of-range"), std::string::npos);
    EXPECT_EQ(m.registers()[0], 65536);
}
