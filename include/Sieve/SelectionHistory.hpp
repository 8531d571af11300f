// =================================================================
// include/Sieve/SelectionHistory.hpp
// =================================================================
// Header for the bounded undo/redo history of selection snapshots.

#pragma once

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace Sieve {

/**
 * @brief Included and excluded path lists at one point in time
 */
struct SelectionSnapshot {
    std::vector<std::string> included;
    std::vector<std::string> excluded;

    bool operator==(const SelectionSnapshot& other) const {
        return included == other.included && excluded == other.excluded;
    }
    bool operator!=(const SelectionSnapshot& other) const { return !(*this == other); }
};

/**
 * @brief Two stacks of snapshots, past bounded and future cleared on every new record
 */
class SelectionHistory {
public:
    /**
     * @brief Construct a history
     * @param limit Maximum number of past snapshots kept, oldest dropped first
     */
    explicit SelectionHistory(size_t limit = 20);

    /**
     * @brief Record the state before a mutation
     *
     * Clears the redo stack.
     */
    void recordSnapshot(const std::vector<std::string>& included,
                        const std::vector<std::string>& excluded);

    /**
     * @brief Step back
     * @param current State to move onto the redo stack
     * @return Snapshot to apply, or std::nullopt when there is nothing to undo
     */
    std::optional<SelectionSnapshot> undo(const SelectionSnapshot& current);

    /**
     * @brief Step forward
     * @param current State to move onto the undo stack
     * @return Snapshot to apply, or std::nullopt when there is nothing to redo
     */
    std::optional<SelectionSnapshot> redo(const SelectionSnapshot& current);

    bool canUndo() const { return !m_past.empty(); }
    bool canRedo() const { return !m_future.empty(); }

    size_t pastSize() const { return m_past.size(); }
    size_t futureSize() const { return m_future.size(); }
    size_t getLimit() const { return m_limit; }

    /**
     * @brief Past snapshots, oldest first
     */
    const std::deque<SelectionSnapshot>& getPast() const { return m_past; }

    void clear();

private:
    size_t m_limit;
    std::deque<SelectionSnapshot> m_past;     ///< Back is the most recent
    std::deque<SelectionSnapshot> m_future;   ///< Front is the next redo

    void pushPast(SelectionSnapshot snapshot);
};

} // namespace Sieve
