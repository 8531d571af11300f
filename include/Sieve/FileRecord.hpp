// =================================================================
// include/Sieve/FileRecord.hpp
// =================================================================
// Defines the per-file selection record and the maps built from it.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief One discovered project file and its selection flags
 *
 * Invariant: included and force_excluded are never both true.
 */
struct FileRecord {
    std::string path;                 ///< Project-relative path, the map key
    std::string comparable_path;      ///< Comparison key derived once from path
    std::optional<uint64_t> size;     ///< Byte size when the listing reported it
    bool included = false;            ///< Part of the active selection
    bool force_excluded = false;      ///< Explicitly excluded by the user

    FileRecord() = default;

    FileRecord(const std::string& file_path, const std::string& comparable)
        : path(file_path), comparable_path(comparable) {}

    /**
     * @brief Compare the selection-relevant part of two records
     */
    bool sameSelectionState(const FileRecord& other) const {
        return path == other.path &&
               included == other.included &&
               force_excluded == other.force_excluded;
    }
};

/// Keyed by FileRecord::path. Ordered so iteration is deterministic.
using FileMap = std::map<std::string, FileRecord>;

/// File contents keyed by path or comparable path.
using ContentMap = std::map<std::string, std::string>;

using PathList = std::vector<std::string>;

} // namespace Sieve
