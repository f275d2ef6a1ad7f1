#include "branta/Population.hpp"

#include <algorithm>

namespace branta {

Population::Population(size_t capacity): m_capacity(capacity) { m_entries.reserve(capacity + 1); }

size_t Population::insert(std::shared_ptr<const Grammar> grammar, int64_t id, double score) {
    auto position = std::upper_bound(m_entries.begin(), m_entries.end(), score,
            [](double value, const Entry& entry) { return value < entry.score; });
    m_entries.insert(position, Entry{std::move(grammar), id, score});

    size_t evicted = 0;
    if (m_entries.size() > m_capacity) {
        evicted = m_entries.size() - m_capacity;
        m_entries.erase(m_entries.begin(), m_entries.begin() + evicted);
    }
    return evicted;
}

bool Population::isSorted() const {
    return std::is_sorted(m_entries.begin(), m_entries.end(),
            [](const Entry& a, const Entry& b) { return a.score < b.score; });
}

} // namespace branta
