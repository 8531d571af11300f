// =================================================================
// include/Sieve/SelectionReconciler.hpp
// =================================================================
// Header for the state machine that merges a directory listing with the
// session's included and excluded path lists.

#pragma once

#include "Sieve/FileRecord.hpp"
#include "Sieve/SelectionHistory.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Output port of the reconciler
 *
 * The list callbacks replace the session store's setters; the reconciler
 * never persists anything itself.
 */
class SelectionObserver {
public:
    virtual ~SelectionObserver() = default;

    /// New value of the session's included list
    virtual void onIncludedFilesChanged(const std::vector<std::string>& included) { (void)included; }

    /// New value of the session's excluded list
    virtual void onExcludedFilesChanged(const std::vector<std::string>& excluded) { (void)excluded; }

    /// The managed map changed in at least one included/force-excluded flag or key
    virtual void onManagedFilesChanged(const FileMap& files) { (void)files; }

    /// Accumulated unmatched-path warnings changed
    virtual void onPathWarnings(const std::vector<std::string>& warnings) { (void)warnings; }
};

struct ReconcilerOptions {
    size_t history_limit = 20;
    bool detect_session_deletion = true;   ///< Freeze when both lists empty at once
};

/**
 * @brief Outcome of a path-list driven operation
 */
struct SelectionResult {
    bool changed = false;                   ///< Session lists were modified
    size_t matched = 0;                     ///< Inputs that resolved to a record
    std::vector<std::string> warnings;      ///< "Path not found: <input>" entries
};

/**
 * @brief Owner of the managed file map
 *
 * The map is rebuilt from the last raw listing and the session lists on
 * every change: all records start unselected, included entries are applied
 * through PathMatcher, then excluded entries are applied last so an entry on
 * both lists ends up excluded. A rebuild that leaves every key and flag
 * unchanged does not notify the observer.
 *
 * User operations snapshot the session lists into the history, compute the
 * new lists, publish them through the observer and rebuild.
 */
class SelectionReconciler {
public:
    explicit SelectionReconciler(SelectionObserver* observer = nullptr,
                                 const ReconcilerOptions& options = ReconcilerOptions());

    void setObserver(SelectionObserver* observer);

    /**
     * @brief Feed a raw listing and the session lists
     * @param raw_files Records from the directory loader
     * @param included Session included list
     * @param excluded Session excluded list
     * @param session_transitioning The session store is switching sessions;
     *        rebuilds are suspended until a call without the flag
     * @return true if the managed map changed
     */
    bool reconcile(const FileMap& raw_files,
                   const std::vector<std::string>& included,
                   const std::vector<std::string>& excluded,
                   bool session_transitioning = false);

    /**
     * @brief Flip inclusion of one file
     * @param path Record key, or any path that resolves to one
     * @return false if the path is unknown
     */
    bool toggleInclude(const std::string& path);

    /**
     * @brief Flip forced exclusion of one file
     * @param path Record key, or any path that resolves to one
     * @return false if the path is unknown
     */
    bool toggleExclude(const std::string& path);

    /**
     * @brief Include or un-include a batch of files
     * @param should_include Target inclusion state
     * @param target_paths Record keys or resolvable paths
     * @return Number of records whose state changed
     */
    size_t bulkSet(bool should_include, const std::vector<std::string>& target_paths);

    /**
     * @brief Include the records matched by free-form paths
     * @param paths Inputs resolved through PathMatcher
     * @param merge_with_existing Union with the included list instead of replacing it
     */
    SelectionResult applyFromPaths(const std::vector<std::string>& paths, bool merge_with_existing = true);

    /**
     * @brief Make the matched records the whole selection
     */
    SelectionResult replaceAllFromPaths(const std::vector<std::string>& paths);

    bool undo();
    bool redo();
    bool canUndo() const { return m_history.canUndo(); }
    bool canRedo() const { return m_history.canRedo(); }

    /**
     * @brief Forget the managed map, lists, warnings, history and freeze state
     */
    void reset();

    const FileMap& getManagedFiles() const { return m_managed; }

    /// Keys with included set and force_excluded clear
    std::vector<std::string> getIncludedPaths() const;

    /// Keys with force_excluded set
    std::vector<std::string> getExcludedPaths() const;

    const std::vector<std::string>& getSessionIncluded() const { return m_included; }
    const std::vector<std::string>& getSessionExcluded() const { return m_excluded; }

    const std::vector<std::string>& getPathWarnings() const { return m_path_warnings; }
    void clearPathWarnings();

    bool isFrozen() const { return m_frozen; }
    const SelectionHistory& getHistory() const { return m_history; }

private:
    SelectionObserver* m_observer;
    ReconcilerOptions m_options;
    SelectionHistory m_history;

    FileMap m_raw;
    FileMap m_managed;
    std::vector<std::string> m_included;
    std::vector<std::string> m_excluded;
    std::vector<std::string> m_path_warnings;

    bool m_frozen = false;
    bool m_frozen_by_signal = false;
    size_t m_prev_included_size = 0;
    size_t m_prev_excluded_size = 0;

    /**
     * @brief Rebuild the managed map from m_raw and the session lists
     * @return true if the map differs from the previous one
     */
    bool rebuild();

    /**
     * @brief Install new session lists on behalf of a user operation
     * @return false when both lists are unchanged
     */
    bool commit(const std::string& operation,
                std::vector<std::string> included,
                std::vector<std::string> excluded);

    void applySnapshot(const SelectionSnapshot& snapshot, const std::string& operation);

    std::optional<std::string> findKey(const std::string& path) const;

    /**
     * @brief Drop list entries that refer to any of the given records
     */
    std::vector<std::string> withoutKeys(const std::vector<std::string>& list,
                                         const std::set<std::string>& keys) const;

    /**
     * @brief Append record keys not yet represented in the list
     */
    void appendKeys(std::vector<std::string>& list, const std::vector<std::string>& keys) const;

    void addWarnings(const std::vector<std::string>& warnings);

    static bool sameSelectionState(const FileMap& a, const FileMap& b);
};

} // namespace Sieve
