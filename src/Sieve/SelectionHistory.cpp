// =================================================================
// src/Sieve/SelectionHistory.cpp
// =================================================================
// Implementation for the undo/redo history.

#include "Sieve/SelectionHistory.hpp"

namespace Sieve {

SelectionHistory::SelectionHistory(size_t limit)
    : m_limit(limit == 0 ? 1 : limit) {}

void SelectionHistory::recordSnapshot(const std::vector<std::string>& included,
                                      const std::vector<std::string>& excluded) {
    pushPast(SelectionSnapshot{included, excluded});
    m_future.clear();
}

std::optional<SelectionSnapshot> SelectionHistory::undo(const SelectionSnapshot& current) {
    if (m_past.empty()) {
        return std::nullopt;
    }

    SelectionSnapshot previous = std::move(m_past.back());
    m_past.pop_back();
    m_future.push_front(current);
    return previous;
}

std::optional<SelectionSnapshot> SelectionHistory::redo(const SelectionSnapshot& current) {
    if (m_future.empty()) {
        return std::nullopt;
    }

    SelectionSnapshot next = std::move(m_future.front());
    m_future.pop_front();
    pushPast(current);
    return next;
}

void SelectionHistory::clear() {
    m_past.clear();
    m_future.clear();
}

void SelectionHistory::pushPast(SelectionSnapshot snapshot) {
    m_past.push_back(std::move(snapshot));
    while (m_past.size() > m_limit) {
        m_past.pop_front();
    }
}

} // namespace Sieve
