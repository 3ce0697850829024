//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares manager for source buffer identifiers and the text
//          diagnostics quote.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings and source copies.
// Links: src/support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace pl0::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and the paths (or
/// pseudo names such as "<input>") of compiled source buffers.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path or buffer name.
    /// @return File identifier (>0 on success, 0 on overflow).
    /// @details Registering the same normalized path twice returns the id
    ///          assigned the first time.
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view; empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Keep a copy of the text compiled under @p file_id.
    /// @details Replaces any text stored earlier for the same id.
    void setSource(uint32_t file_id, std::string text);

    /// @brief Line @p line (1-based) of the stored text, without its newline.
    /// @return Empty when the id, the text or the line is unknown.
    std::string_view getLine(uint32_t file_id, uint32_t line) const;

  private:
    /// Stored paths. Index + 1 is the file identifier.
    /// std::deque keeps string references stable as new files are added.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;

    std::unordered_map<uint32_t, std::string> sources_;
};

} // namespace pl0::support
