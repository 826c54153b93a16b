//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Backing store for the file identifiers carried by schema locations.
/// @details Schema loaders hand the manager document paths and receive small
///          integer ids in return. The ids travel inside SourceLoc values on
///          named types and come back out when a diagnostic is printed.

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace avrokit::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a schema document and assign it a stable identifier.
///
/// @details The path is normalized to its generic form so printed diagnostics
///          look the same on every platform. Identifiers start at one; zero is
///          reserved for "unknown location".
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) for the stored path, or 0 on exhaustion.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, "source manager exhausted file identifier space"), std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace avrokit::support
