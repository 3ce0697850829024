//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bytecode/ProgramRegistry.hpp
// Purpose: Session-scoped store mapping program names to compiled programs.
// Key invariants: At most one program per name; add() replaces an existing
//                 entry. Not synchronized: callers serialize concurrent use.
// Ownership: Programs are shared immutable objects; a running machine keeps
//            the sequences it is executing alive even if they are replaced.
// Lifetime: Owned by the embedding session; outlives compilations and runs
//           that reference it.
// Links: src/frontends/pl0/Compiler.hpp, src/vm/Machine.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bytecode/Program.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace pl0::bytecode
{

/// @brief Name-keyed store of compiled programs.
class ProgramRegistry
{
  public:
    /// @brief Register @p program under its own name, replacing any previous
    ///        program with that name.
    /// @return Shared handle to the stored program.
    std::shared_ptr<const Program> add(Program program);

    /// @brief Find the program registered under @p name.
    /// @return Shared handle, or nullptr when absent.
    std::shared_ptr<const Program> find(const std::string &name) const;

    /// @brief Whether a program named @p name is registered.
    bool contains(const std::string &name) const;

    /// @brief Registered names in lexicographic order.
    std::vector<std::string> names() const;

    size_t size() const
    {
        return programs_.size();
    }

    /// @brief Drop every registered program.
    void clear();

  private:
    std::unordered_map<std::string, std::shared_ptr<const Program>> programs_;
};

} // namespace pl0::bytecode
