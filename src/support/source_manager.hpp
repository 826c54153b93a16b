//===----------------------------------------------------------------------===//
//
// Part of the avrokit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping schema document paths to file ids.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns document path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace avrokit::support
{

/// Maintains the mapping between numeric file identifiers and the schema
/// documents they were read from. The schema loader registers each document
/// and stamps the resulting id into SourceLoc values; diagnostics resolve it
/// back to a path when printed.
class SourceManager
{
  public:
    /// @brief Register document path @p path and return its id.
    /// @param path File system path of the schema document.
    /// @return Identifier (>0 on success, 0 when the id space is exhausted).
    /// @details Registering the same normalized path twice yields the same id.
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return Stored path, or an empty view for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered documents.
    [[nodiscard]] size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Stored paths; element i holds file id i + 1. A deque keeps references
    /// stable while new documents are appended.
    std::deque<std::string> files_;

    /// Next identifier to assign; 64-bit so overflow is detectable.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace avrokit::support
