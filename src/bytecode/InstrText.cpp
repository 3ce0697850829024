//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements formatting and parsing of the instruction text form.
//
//===----------------------------------------------------------------------===//

#include "bytecode/InstrText.hpp"

#include "common/CharUtils.hpp"

#include <charconv>
#include <optional>
#include <vector>

namespace pl0::bytecode
{
namespace
{

using namespace pl0::common::char_utils;

std::optional<int64_t> parseInteger(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    int64_t value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last)
        return std::nullopt;
    return value;
}

/// @brief Parse "r<digits>" (either case) into a register index.
std::optional<int64_t> parseRegister(std::string_view text)
{
    if (text.size() < 2 || (text[0] != 'r' && text[0] != 'R'))
        return std::nullopt;
    for (char c : text.substr(1))
    {
        if (!isDigit(c))
            return std::nullopt;
    }
    return parseInteger(text.substr(1));
}

bool isName(std::string_view text)
{
    if (text.empty() || !(isLetter(text[0]) || text[0] == '_'))
        return false;
    for (char c : text)
    {
        if (!isIdentifierContinue(c))
            return false;
    }
    return true;
}

support::Expected<Operand> parseOperand(std::string_view text, support::SourceLoc loc)
{
    if (text.front() == '#')
    {
        if (auto v = parseInteger(text.substr(1)))
            return Operand::imm(*v);
        return support::makeError(loc, "bad immediate '" + std::string(text) + "'", "P2002");
    }
    if (text.front() == '[')
    {
        if (text.back() != ']')
            return support::makeError(loc, "bad address '" + std::string(text) + "'", "P2002");
        std::string_view inner = trim(text.substr(1, text.size() - 2));
        if (auto r = parseRegister(inner))
            return Operand::regAddr(*r);
        if (auto a = parseInteger(inner))
            return Operand::addr(*a);
        return support::makeError(loc, "bad address '" + std::string(text) + "'", "P2002");
    }
    if (auto r = parseRegister(text))
        return Operand::reg(*r);
    if (isName(text))
        return Operand::sym(std::string(text));
    return support::makeError(loc, "bad operand '" + std::string(text) + "'", "P2002");
}

} // namespace

std::string formatOperand(const Operand &operand)
{
    switch (operand.kind)
    {
        case OperandKind::Reg:
            return "r" + std::to_string(operand.value);
        case OperandKind::Imm:
            return "#" + std::to_string(operand.value);
        case OperandKind::Addr:
            return "[" + std::to_string(operand.value) + "]";
        case OperandKind::RegAddr:
            return "[r" + std::to_string(operand.value) + "]";
        case OperandKind::Symbol:
            return operand.symbol;
        case OperandKind::None:
            return "";
    }
    return "";
}

std::string formatInstr(const Instr &in)
{
    if (in.op == Opcode::LABEL)
    {
        const std::string name = in.operands.empty() ? std::string() : in.operands.front().symbol;
        return name + ":";
    }
    std::string text = opcodeName(in.op);
    for (size_t i = 0; i < in.operands.size(); ++i)
    {
        text += (i == 0) ? " " : ", ";
        text += formatOperand(in.operands[i]);
    }
    return text;
}

/// @brief Parse a single line of the text form.
///
/// @details Mnemonics are case-insensitive.  Operand kinds are inferred from
///          their spelling and then checked against the opcode signature so a
///          mismatch is reported here rather than at execution time.
support::Expected<Instr> parseInstr(std::string_view line, support::SourceLoc loc)
{
    line = trim(line);
    if (line.empty())
        return support::makeError(loc, "empty instruction", "P2001");

    if (line.back() == ':')
    {
        std::string_view name = trim(line.substr(0, line.size() - 1));
        if (!isName(name))
            return support::makeError(loc, "bad label '" + std::string(line) + "'", "P2002");
        // An operand spelled r<digits> is always a register, so no branch could reach it.
        if (parseRegister(name))
            return support::makeError(
                loc, "label '" + std::string(name) + "' is spelled like a register", "P2002");
        return makeLabel(std::string(name));
    }

    size_t split = 0;
    while (split < line.size() && !isWhitespace(line[split]))
        ++split;
    const std::string mnemonic = toUppercase(line.substr(0, split));
    auto op = opcodeFromName(mnemonic);
    if (!op)
    {
        return support::makeError(
            loc, "unknown instruction '" + std::string(line.substr(0, split)) + "'", "P2001");
    }

    Instr in{*op, {}};
    std::string_view rest = trim(line.substr(split));
    while (!rest.empty())
    {
        const size_t comma = rest.find(',');
        std::string_view piece = trim(rest.substr(0, comma));
        if (piece.empty())
            return support::makeError(
                loc, "missing operand in '" + std::string(line) + "'", "P2003");
        auto operand = parseOperand(piece, loc);
        if (!operand)
            return operand.error();
        in.operands.push_back(std::move(operand.value()));
        if (comma == std::string_view::npos)
            break;
        rest = rest.substr(comma + 1);
        if (trim(rest).empty())
            return support::makeError(
                loc, "missing operand in '" + std::string(line) + "'", "P2003");
    }

    if (auto err = validateOperands(in))
        return support::makeError(loc, *err, "P2004");
    return in;
}

support::Expected<Program> assembleProgram(std::string name,
                                           std::string_view text,
                                           uint32_t fileId)
{
    Program program{std::move(name), {}};
    uint32_t lineNo = 0;
    while (!text.empty())
    {
        ++lineNo;
        const size_t nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        text = (nl == std::string_view::npos) ? std::string_view() : text.substr(nl + 1);
        if (trim(line).empty())
            continue;
        auto in = parseInstr(line, support::SourceLoc{fileId, lineNo, 1, 0});
        if (!in)
            return in.error();
        program.code.push_back(std::move(in.value()));
    }
    return program;
}

void disassemble(const Program &program, std::ostream &os)
{
    for (const Instr &in : program.code)
        os << formatInstr(in) << '\n';
}

} // namespace pl0::bytecode
