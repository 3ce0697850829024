//===----------------------------------------------------------------------===//
//
// Part of the PL0 project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking the source
// buffers referenced by diagnostics.  The manager assigns stable numeric
// identifiers to paths and resolves those identifiers back to normalized
// strings when diagnostics are printed.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace pl0::support
{
namespace
{

std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}

} // namespace

/// @brief Register a path and assign it a stable identifier.
///
/// @details The path is normalized into a generic string so diagnostics print
///          the same text regardless of platform separators.  Identifiers
///          start at one, leaving zero to represent an unknown location.
///
/// @param path Filesystem path (or buffer name) to normalize and store.
/// @return Identifier (>0) representing the stored path, or 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
///
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or an empty view if @p file_id is unknown.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

void SourceManager::setSource(uint32_t file_id, std::string text)
{
    if (file_id == 0)
        return;
    sources_[file_id] = std::move(text);
}

std::string_view SourceManager::getLine(uint32_t file_id, uint32_t line) const
{
    if (line == 0)
        return {};
    auto it = sources_.find(file_id);
    if (it == sources_.end())
        return {};

    std::string_view src = it->second;
    size_t start = 0;
    for (uint32_t l = 1; l < line; ++l)
    {
        const size_t pos = src.find('\n', start);
        if (pos == std::string_view::npos)
            return {};
        start = pos + 1;
    }
    size_t end = src.find('\n', start);
    if (end == std::string_view::npos)
        end = src.size();
    if (end > start && src[end - 1] == '\r')
        --end;
    return src.substr(start, end - start);
}

} // namespace pl0::support
