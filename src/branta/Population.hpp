#ifndef SRC_BRANTA_POPULATION_HPP_
#define SRC_BRANTA_POPULATION_HPP_

#include "branta/Grammar.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace branta {

// Bounded set of candidate grammars kept sorted ascending by score. Among equal scores older entries come first, so
// they are the first evicted when the population overflows.
class Population {
public:
    struct Entry {
        std::shared_ptr<const Grammar> grammar;
        int64_t id;
        double score;
    };

    explicit Population(size_t capacity);
    ~Population() = default;

    // Inserts after every entry scoring less than or equal to |score|, then evicts from the low end until back at
    // capacity. Returns the number of entries evicted.
    size_t insert(std::shared_ptr<const Grammar> grammar, int64_t id, double score);

    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }
    size_t capacity() const { return m_capacity; }

    // Callers must check that the population isn't empty before asking for these.
    const Entry& lowest() const { return m_entries.front(); }
    const Entry& best() const { return m_entries.back(); }
    const Entry& at(size_t index) const { return m_entries[index]; }
    const std::vector<Entry>& entries() const { return m_entries; }

    bool isSorted() const;

private:
    size_t m_capacity;
    std::vector<Entry> m_entries;
};

} // namespace branta

#endif // SRC_BRANTA_POPULATION_HPP_
