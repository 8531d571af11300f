// =================================================================
// src/Sieve/SelectionReconciler.cpp
// =================================================================
// Implementation for the selection reconciler.

#include "Sieve/SelectionReconciler.hpp"
#include "Sieve/Logger.hpp"
#include "Sieve/PathMatcher.hpp"
#include "Sieve/PathNormalizer.hpp"

namespace Sieve {

namespace {

// Resolve a session list entry by entry, in order. File-name matches skip
// records claimed by earlier entries of the same list.
std::vector<std::optional<std::string>> resolveEntries(const PathMatcher& matcher,
                                                       const std::vector<std::string>& list) {
    std::vector<std::optional<std::string>> keys;
    keys.reserve(list.size());
    std::set<std::string> claimed;
    for (const auto& entry : list) {
        auto match = matcher.resolve(entry, claimed);
        if (match) {
            claimed.insert(match->key);
            keys.push_back(match->key);
        } else {
            keys.push_back(std::nullopt);
        }
    }
    return keys;
}

} // namespace

SelectionReconciler::SelectionReconciler(SelectionObserver* observer, const ReconcilerOptions& options)
    : m_observer(observer),
      m_options(options),
      m_history(options.history_limit) {}

void SelectionReconciler::setObserver(SelectionObserver* observer) {
    m_observer = observer;
}

bool SelectionReconciler::reconcile(const FileMap& raw_files,
                                    const std::vector<std::string>& included,
                                    const std::vector<std::string>& excluded,
                                    bool session_transitioning) {
    m_raw = raw_files;

    // While frozen the held lists stay in place so user operations and the
    // visible selection keep agreeing
    if (session_transitioning) {
        if (!m_frozen) {
            LOG_INFO("SelectionReconciler", "Session switch in progress, holding current selection");
        }
        m_frozen = true;
        m_frozen_by_signal = true;
        return false;
    }

    if (m_frozen_by_signal) {
        m_frozen = false;
        m_frozen_by_signal = false;
        LOG_DEBUG("SelectionReconciler", "Session switch finished");
    }

    bool lists_empty = included.empty() && excluded.empty();
    bool had_entries = m_prev_included_size > 0 || m_prev_excluded_size > 0;

    if (m_options.detect_session_deletion && lists_empty && had_entries && !m_frozen) {
        // Both lists vanished in one update: treat as a session being deleted
        LOG_INFO("SelectionReconciler", "Selection lists cleared together, freezing rebuilds");
        m_frozen = true;
        m_prev_included_size = 0;
        m_prev_excluded_size = 0;
        return false;
    }

    if (!lists_empty && m_frozen) {
        LOG_DEBUG("SelectionReconciler", "Selection lists repopulated, resuming rebuilds");
        m_frozen = false;
    }

    if (m_frozen) {
        return false;
    }

    m_included = included;
    m_excluded = excluded;
    m_prev_included_size = included.size();
    m_prev_excluded_size = excluded.size();

    if (m_raw.empty()) {
        return false;
    }

    return rebuild();
}

bool SelectionReconciler::toggleInclude(const std::string& path) {
    auto key = findKey(path);
    if (!key) {
        LOG_WARNING("SelectionReconciler", "Cannot toggle unknown file: " + path);
        return false;
    }

    const FileRecord& record = m_managed.at(*key);
    std::set<std::string> keys{*key};
    std::vector<std::string> included = withoutKeys(m_included, keys);
    std::vector<std::string> excluded = withoutKeys(m_excluded, keys);

    // Un-include only when the record is visibly included
    if (!(record.included && !record.force_excluded)) {
        included.push_back(record.path);
    }

    commit("toggle include", std::move(included), std::move(excluded));
    return true;
}

bool SelectionReconciler::toggleExclude(const std::string& path) {
    auto key = findKey(path);
    if (!key) {
        LOG_WARNING("SelectionReconciler", "Cannot toggle unknown file: " + path);
        return false;
    }

    const FileRecord& record = m_managed.at(*key);
    std::set<std::string> keys{*key};
    std::vector<std::string> excluded = withoutKeys(m_excluded, keys);
    std::vector<std::string> included = m_included;

    if (!record.force_excluded) {
        included = withoutKeys(m_included, keys);
        excluded.push_back(record.path);
    }

    commit("toggle exclude", std::move(included), std::move(excluded));
    return true;
}

size_t SelectionReconciler::bulkSet(bool should_include, const std::vector<std::string>& target_paths) {
    std::set<std::string> changed;
    std::vector<std::string> changed_in_order;

    for (const auto& target : target_paths) {
        auto key = findKey(target);
        if (!key) {
            LOG_DEBUG("SelectionReconciler", "Bulk target not in listing: " + target);
            continue;
        }

        const FileRecord& record = m_managed.at(*key);
        bool visibly_included = record.included && !record.force_excluded;
        if (visibly_included == should_include) {
            continue;
        }
        if (changed.insert(*key).second) {
            changed_in_order.push_back(*key);
        }
    }

    if (changed.empty()) {
        return 0;
    }

    std::vector<std::string> included = withoutKeys(m_included, changed);
    std::vector<std::string> excluded = m_excluded;

    if (should_include) {
        excluded = withoutKeys(m_excluded, changed);
        appendKeys(included, changed_in_order);
    }

    commit(should_include ? "bulk include" : "bulk exclude", std::move(included), std::move(excluded));
    return changed.size();
}

SelectionResult SelectionReconciler::applyFromPaths(const std::vector<std::string>& paths,
                                                    bool merge_with_existing) {
    SelectionResult result;
    if (paths.empty()) {
        return result;
    }

    BatchMatchResult batch = PathMatcher(m_managed).resolveAll(paths);
    result.matched = batch.keys.size();
    result.warnings = batch.warnings;
    addWarnings(batch.warnings);

    std::set<std::string> keys(batch.keys.begin(), batch.keys.end());
    std::vector<std::string> included;
    if (merge_with_existing) {
        included = m_included;
    }
    appendKeys(included, batch.keys);

    std::vector<std::string> excluded = withoutKeys(m_excluded, keys);

    result.changed = commit(merge_with_existing ? "apply paths" : "apply paths (replace)",
                            std::move(included), std::move(excluded));
    return result;
}

SelectionResult SelectionReconciler::replaceAllFromPaths(const std::vector<std::string>& paths) {
    SelectionResult result;
    if (paths.empty()) {
        return result;
    }

    BatchMatchResult batch = PathMatcher(m_managed).resolveAll(paths);
    result.matched = batch.keys.size();
    result.warnings = batch.warnings;
    addWarnings(batch.warnings);

    std::set<std::string> keys(batch.keys.begin(), batch.keys.end());
    std::vector<std::string> included;
    appendKeys(included, batch.keys);
    std::vector<std::string> excluded = withoutKeys(m_excluded, keys);

    result.changed = commit("replace selection", std::move(included), std::move(excluded));
    return result;
}

bool SelectionReconciler::undo() {
    auto snapshot = m_history.undo(SelectionSnapshot{m_included, m_excluded});
    if (!snapshot) {
        return false;
    }
    applySnapshot(*snapshot, "undo");
    return true;
}

bool SelectionReconciler::redo() {
    auto snapshot = m_history.redo(SelectionSnapshot{m_included, m_excluded});
    if (!snapshot) {
        return false;
    }
    applySnapshot(*snapshot, "redo");
    return true;
}

void SelectionReconciler::reset() {
    bool had_files = !m_managed.empty();

    m_managed.clear();
    m_included.clear();
    m_excluded.clear();
    m_path_warnings.clear();
    m_history.clear();
    m_frozen = false;
    m_frozen_by_signal = false;
    m_prev_included_size = 0;
    m_prev_excluded_size = 0;

    LOG_DEBUG("SelectionReconciler", "Selection state reset");

    if (m_observer) {
        if (had_files) {
            m_observer->onManagedFilesChanged(m_managed);
        }
        m_observer->onPathWarnings(m_path_warnings);
    }
}

std::vector<std::string> SelectionReconciler::getIncludedPaths() const {
    std::vector<std::string> paths;
    for (const auto& [key, record] : m_managed) {
        if (record.included && !record.force_excluded) {
            paths.push_back(key);
        }
    }
    return paths;
}

std::vector<std::string> SelectionReconciler::getExcludedPaths() const {
    std::vector<std::string> paths;
    for (const auto& [key, record] : m_managed) {
        if (record.force_excluded) {
            paths.push_back(key);
        }
    }
    return paths;
}

void SelectionReconciler::clearPathWarnings() {
    if (m_path_warnings.empty()) {
        return;
    }
    m_path_warnings.clear();
    if (m_observer) {
        m_observer->onPathWarnings(m_path_warnings);
    }
}

bool SelectionReconciler::rebuild() {
    FileMap next;
    for (const auto& [key, raw] : m_raw) {
        FileRecord record = raw;
        record.included = false;
        record.force_excluded = false;
        if (record.comparable_path.empty()) {
            record.comparable_path = PathNormalizer::normalizeForComparison(key);
        }
        next.emplace(key, std::move(record));
    }

    size_t unmatched = 0;
    {
        PathMatcher matcher(next);

        for (const auto& key : resolveEntries(matcher, m_included)) {
            if (!key) {
                unmatched++;
                continue;
            }
            FileRecord& record = next.at(*key);
            record.included = true;
            record.force_excluded = false;
        }

        // Exclusions last so they win over an include of the same file
        for (const auto& key : resolveEntries(matcher, m_excluded)) {
            if (!key) {
                unmatched++;
                continue;
            }
            FileRecord& record = next.at(*key);
            record.included = false;
            record.force_excluded = true;
        }
    }

    bool changed = !sameSelectionState(next, m_managed);
    m_managed = std::move(next);

    size_t included_count = 0;
    size_t excluded_count = 0;
    for (const auto& [key, record] : m_managed) {
        if (record.force_excluded) {
            excluded_count++;
        } else if (record.included) {
            included_count++;
        }
    }
    Logger::getInstance().logReconcile(m_managed.size(), included_count, excluded_count, unmatched);

    if (changed && m_observer) {
        m_observer->onManagedFilesChanged(m_managed);
    }
    return changed;
}

bool SelectionReconciler::commit(const std::string& operation,
                                 std::vector<std::string> included,
                                 std::vector<std::string> excluded) {
    bool included_changed = included != m_included;
    bool excluded_changed = excluded != m_excluded;
    if (!included_changed && !excluded_changed) {
        LOG_DEBUG("SelectionReconciler", operation + " left the selection unchanged");
        return false;
    }

    m_history.recordSnapshot(m_included, m_excluded);

    m_included = std::move(included);
    m_excluded = std::move(excluded);
    m_prev_included_size = m_included.size();
    m_prev_excluded_size = m_excluded.size();
    if (!m_frozen_by_signal) {
        m_frozen = false;
    }

    if (m_observer) {
        if (included_changed) {
            m_observer->onIncludedFilesChanged(m_included);
        }
        if (excluded_changed) {
            m_observer->onExcludedFilesChanged(m_excluded);
        }
    }

    rebuild();
    Logger::getInstance().logSelectionChange(operation, m_included.size(), m_excluded.size());
    return true;
}

void SelectionReconciler::applySnapshot(const SelectionSnapshot& snapshot, const std::string& operation) {
    bool included_changed = snapshot.included != m_included;
    bool excluded_changed = snapshot.excluded != m_excluded;

    m_included = snapshot.included;
    m_excluded = snapshot.excluded;
    m_prev_included_size = m_included.size();
    m_prev_excluded_size = m_excluded.size();
    if (!m_frozen_by_signal) {
        m_frozen = false;
    }

    if (m_observer) {
        if (included_changed) {
            m_observer->onIncludedFilesChanged(m_included);
        }
        if (excluded_changed) {
            m_observer->onExcludedFilesChanged(m_excluded);
        }
    }

    rebuild();
    Logger::getInstance().logSelectionChange(operation, m_included.size(), m_excluded.size());
}

std::optional<std::string> SelectionReconciler::findKey(const std::string& path) const {
    if (m_managed.count(path) > 0) {
        return path;
    }

    auto match = PathMatcher(m_managed).resolve(path);
    if (!match) {
        return std::nullopt;
    }
    return match->key;
}

std::vector<std::string> SelectionReconciler::withoutKeys(const std::vector<std::string>& list,
                                                          const std::set<std::string>& keys) const {
    std::set<std::string> comparables;
    for (const auto& key : keys) {
        auto it = m_managed.find(key);
        comparables.insert(it != m_managed.end()
            ? it->second.comparable_path
            : PathNormalizer::normalizeForComparison(key));
    }

    PathMatcher matcher(m_managed);
    std::vector<std::optional<std::string>> resolved = resolveEntries(matcher, list);

    std::vector<std::string> kept;
    std::set<std::string> claimed;
    for (size_t i = 0; i < list.size(); ++i) {
        const std::string& entry = list[i];
        const std::optional<std::string>& key = resolved[i];
        if (comparables.count(PathNormalizer::normalizeForComparison(entry)) > 0) {
            continue;
        }
        // Entries written in another form still map onto the same record
        if (key && keys.count(*key) > 0) {
            continue;
        }
        if (!key) {
            kept.push_back(entry);
            continue;
        }

        // Dropping an earlier entry frees its record for file-name matching;
        // pin the entry to its key when it would move onto that record
        auto now = matcher.resolve(entry, claimed);
        kept.push_back(now && now->key == *key ? entry : *key);
        claimed.insert(*key);
    }
    return kept;
}

void SelectionReconciler::appendKeys(std::vector<std::string>& list,
                                     const std::vector<std::string>& keys) const {
    std::set<std::string> present;
    for (const auto& entry : list) {
        present.insert(PathNormalizer::normalizeForComparison(entry));
    }

    for (const auto& key : keys) {
        auto it = m_managed.find(key);
        std::string comparable = it != m_managed.end()
            ? it->second.comparable_path
            : PathNormalizer::normalizeForComparison(key);
        if (present.insert(comparable).second) {
            list.push_back(key);
        }
    }
}

void SelectionReconciler::addWarnings(const std::vector<std::string>& warnings) {
    if (warnings.empty()) {
        return;
    }
    m_path_warnings.insert(m_path_warnings.end(), warnings.begin(), warnings.end());
    if (m_observer) {
        m_observer->onPathWarnings(m_path_warnings);
    }
}

bool SelectionReconciler::sameSelectionState(const FileMap& a, const FileMap& b) {
    if (a.size() != b.size()) {
        return false;
    }
    auto it_a = a.begin();
    auto it_b = b.begin();
    for (; it_a != a.end(); ++it_a, ++it_b) {
        if (it_a->first != it_b->first || !it_a->second.sameSelectionState(it_b->second)) {
            return false;
        }
    }
    return true;
}

} // namespace Sieve
