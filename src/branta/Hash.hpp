#ifndef SRC_BRANTA_HASH_HPP_
#define SRC_BRANTA_HASH_HPP_

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace branta {

using Hash = std::uint32_t;

Hash hash(std::string_view text, Hash seed = 0);
Hash hash(const char* text, size_t length, Hash seed = 0);

} // namespace branta

#endif // SRC_BRANTA_HASH_HPP_
