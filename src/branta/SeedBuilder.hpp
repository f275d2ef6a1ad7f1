#ifndef SRC_BRANTA_SEED_BUILDER_HPP_
#define SRC_BRANTA_SEED_BUILDER_HPP_

#include "branta/Grammar.hpp"

#include <string>
#include <vector>

namespace branta {

// Builds the initial grammar of a search: one leaf rule per distinct character in the guides, a
// multi-byte UTF-8 sequence counting as one character, numbered t1, t2, ... in
// order of first appearance, and an entry rule t0 with one body per guide spelling it out as a sequence of leaves.
// The result accepts exactly the guide strings.
class SeedBuilder {
public:
    static constexpr const char* kEntryName = "t0";

    SeedBuilder() = default;
    ~SeedBuilder() = default;

    Grammar build(const std::vector<std::string>& guides) const;
};

} // namespace branta

#endif // SRC_BRANTA_SEED_BUILDER_HPP_
