#include "branta/Hash.hpp"

#include "xxhash.h"

namespace branta {

Hash hash(std::string_view text, Hash seed) {
    return hash(text.data(), text.size(), seed);
}

Hash hash(const char* text, size_t length, Hash seed) {
    return XXH32(text, length, seed);
}

} // namespace branta
