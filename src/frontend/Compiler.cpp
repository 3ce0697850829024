//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the PL/0 compiler driver that runs the lexer and the
// parser/code generator and registers the finished instruction sequence.
//
//===----------------------------------------------------------------------===//

#include "frontend/Compiler.hpp"
#include "frontend/Lexer.hpp"
#include "frontend/Parser.hpp"

namespace pl0::frontend
{

namespace
{

struct CompiledUnit
{
    std::unique_ptr<ProgramDecl> ast;
    std::shared_ptr<const bytecode::Program> program;
};

CompiledUnit compileUnit(std::string source,
                         uint32_t fileId,
                         const CompilerOptions &options,
                         bytecode::ProgramRegistry &registry,
                         support::DiagnosticEngine &diag)
{
    CompiledUnit unit;

    // Phase 1: Lexing
    Lexer lexer(std::move(source), fileId, diag);

    // Phase 2: Parsing and code generation
    Parser parser(lexer, diag, options, registry);
    auto parsed = parser.parseProgram();
    if (!parsed || parser.hasError())
        return unit;

    // Phase 3: Registration
    unit.program = registry.add(bytecode::Program{parsed.node->name, std::move(parsed.code)});
    unit.ast = std::move(parsed.node);
    return unit;
}

/// @brief Blank everything before @p offset except newlines so that positions
///        inside the unit stay relative to the whole file.
std::string maskPrefix(std::string_view text, size_t offset, size_t length)
{
    std::string out(text.substr(0, offset + length));
    for (size_t i = 0; i < offset; ++i)
    {
        if (out[i] != '\n')
            out[i] = ' ';
    }
    return out;
}

} // namespace

bool CompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0 && program != nullptr;
}

bool MultiCompilerResult::succeeded() const
{
    return diagnostics.errorCount() == 0 && !programs.empty();
}

CompilerResult compilePl0(std::string_view source,
                          const CompilerOptions &options,
                          bytecode::ProgramRegistry &registry,
                          support::SourceManager &sm)
{
    CompilerResult result{};
    result.fileId = sm.addFile(options.path);
    sm.setSource(result.fileId, std::string(source));

    auto unit =
        compileUnit(std::string(source), result.fileId, options, registry, result.diagnostics);
    result.ast = std::move(unit.ast);
    result.program = std::move(unit.program);
    return result;
}

support::Expected<std::vector<ProgramSource>> splitPrograms(std::string_view text,
                                                            uint32_t fileId)
{
    support::DiagnosticEngine diag;
    const auto tokens = tokenize(std::string(text), fileId, diag);
    if (tokens.back().kind == TokenKind::Error)
        return *diag.firstError();

    std::vector<size_t> starts;
    std::vector<std::string> names;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        if (tokens[i].kind != TokenKind::KwProgram)
            continue;
        starts.push_back(tokens[i].loc.offset);
        const bool named = i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::Identifier;
        names.push_back(named ? tokens[i + 1].text : std::string());
    }

    if (starts.empty())
        return support::makeError(tokens.front().loc, "no 'program' found in source", "P1011");

    std::vector<ProgramSource> units;
    units.reserve(starts.size());
    for (size_t i = 0; i < starts.size(); ++i)
    {
        const size_t end = i + 1 < starts.size() ? starts[i + 1] : text.size();
        units.push_back(ProgramSource{
            std::move(names[i]), starts[i], std::string(text.substr(starts[i], end - starts[i]))});
    }
    return units;
}

MultiCompilerResult compileAll(std::string_view text,
                               const CompilerOptions &options,
                               const ProgramLayout &layout,
                               bytecode::ProgramRegistry &registry,
                               support::SourceManager &sm)
{
    MultiCompilerResult result{};
    result.fileId = sm.addFile(options.path);
    sm.setSource(result.fileId, std::string(text));

    auto units = splitPrograms(text, result.fileId);
    if (!units)
    {
        result.diagnostics.report(units.error());
        return result;
    }

    int64_t nextBase = 0;
    for (const ProgramSource &source : units.value())
    {
        CompilerOptions unitOptions = options;
        auto mapped = layout.baseMap.find(source.name);
        unitOptions.baseAddress = mapped != layout.baseMap.end() ? mapped->second : nextBase;
        nextBase = unitOptions.baseAddress + layout.baseStep;

        auto unit = compileUnit(maskPrefix(text, source.offset, source.text.size()),
                                result.fileId,
                                unitOptions,
                                registry,
                                result.diagnostics);
        if (!unit.program)
            return result;
        result.programs.push_back(std::move(unit.program));
        result.asts.push_back(std::move(unit.ast));
    }
    return result;
}

} // namespace pl0::frontend
