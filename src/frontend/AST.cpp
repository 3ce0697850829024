//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the indented AST outline used by `pl0run --dump-ast`.
//
//===----------------------------------------------------------------------===//

#include "frontend/AST.hpp"

namespace pl0::frontend
{
namespace
{

const char *binaryOpName(BinaryExpr::Op op)
{
    switch (op)
    {
        case BinaryExpr::Op::Add:
            return "+";
        case BinaryExpr::Op::Sub:
            return "-";
        case BinaryExpr::Op::Mul:
            return "*";
        case BinaryExpr::Op::Div:
            return "/";
    }
    return "?";
}

class AstPrinter
{
  public:
    explicit AstPrinter(std::ostream &os) : os_(os) {}

    void print(const ProgramDecl &program)
    {
        line() << "program " << program.name << '\n';
        ++depth_;
        for (const VarDecl &v : program.block.vars)
            line() << "var " << v.name << " @" << v.address << '\n';
        if (program.block.body)
            print(*program.block.body);
        --depth_;
    }

  private:
    std::ostream &line()
    {
        for (int i = 0; i < depth_; ++i)
            os_ << "  ";
        return os_;
    }

    void print(const Stmt &stmt)
    {
        switch (stmt.kind)
        {
            case StmtKind::Empty:
                line() << "empty\n";
                return;
            case StmtKind::Assign:
            {
                const auto &s = static_cast<const AssignStmt &>(stmt);
                line() << "assign " << s.name << " @" << s.address << '\n';
                nested(*s.value);
                return;
            }
            case StmtKind::Call:
                line() << "call " << static_cast<const CallStmt &>(stmt).program << '\n';
                return;
            case StmtKind::If:
            {
                const auto &s = static_cast<const IfStmt &>(stmt);
                line() << "if -> " << s.skipLabel << '\n';
                nested(*s.condition);
                nested(*s.thenStmt);
                return;
            }
            case StmtKind::While:
            {
                const auto &s = static_cast<const WhileStmt &>(stmt);
                line() << "while " << s.startLabel << " -> " << s.exitLabel << '\n';
                nested(*s.condition);
                nested(*s.body);
                return;
            }
            case StmtKind::Compound:
            {
                line() << "begin\n";
                for (const auto &child : static_cast<const CompoundStmt &>(stmt).statements)
                    nested(*child);
                line() << "end\n";
                return;
            }
            case StmtKind::Push:
            case StmtKind::Pop:
            {
                const auto &s = static_cast<const StackStmt &>(stmt);
                line() << (stmt.kind == StmtKind::Push ? "push " : "pop ") << s.name << " @"
                       << s.address << '\n';
                return;
            }
            case StmtKind::Peek:
            case StmtKind::Poke:
            {
                const auto &s = static_cast<const MemoryStmt &>(stmt);
                line() << (stmt.kind == StmtKind::Peek ? "peek(" : "poke(") << s.first << ", "
                       << s.second << ")\n";
                return;
            }
        }
    }

    void print(const Expr &expr)
    {
        switch (expr.kind)
        {
            case ExprKind::Number:
            {
                const auto &e = static_cast<const NumberExpr &>(expr);
                line() << (e.isFixed ? "fixed " : "number ") << e.value;
                if (e.isFixed)
                    os_ << " (" << e.raw << ')';
                os_ << '\n';
                return;
            }
            case ExprKind::VariableRef:
            {
                const auto &e = static_cast<const VariableRefExpr &>(expr);
                line() << "var " << e.name << " @" << e.address << '\n';
                return;
            }
            case ExprKind::ConstantRef:
            {
                const auto &e = static_cast<const ConstantRefExpr &>(expr);
                line() << "const " << e.name << " = " << e.value << '\n';
                return;
            }
            case ExprKind::Binary:
            {
                const auto &e = static_cast<const BinaryExpr &>(expr);
                line() << "binary " << binaryOpName(e.op) << " tmp@" << e.tempAddress << '\n';
                nested(*e.lhs);
                nested(*e.rhs);
                return;
            }
            case ExprKind::Intrinsic:
            {
                const auto &e = static_cast<const IntrinsicExpr &>(expr);
                line() << "intrinsic " << e.name << " (" << common::mathOpName(e.op) << ")\n";
                nested(*e.arg);
                return;
            }
            case ExprKind::FixedConvert:
            {
                const auto &e = static_cast<const FixedConvertExpr &>(expr);
                line() << (e.direction == FixedConvertExpr::Direction::ToFixed ? "fx" : "int")
                       << '\n';
                nested(*e.arg);
                return;
            }
        }
    }

    template <typename Node> void nested(const Node &node)
    {
        ++depth_;
        print(node);
        --depth_;
    }

    std::ostream &os_;
    int depth_ = 0;
};

} // namespace

void dumpAst(const ProgramDecl &program, std::ostream &os)
{
    AstPrinter(os).print(program);
}

} // namespace pl0::frontend
