#ifndef SRC_BRANTA_DUMP_POPULATION_JSON_HPP_
#define SRC_BRANTA_DUMP_POPULATION_JSON_HPP_

#include <string>

namespace branta {

class Search;

// Produces a JSON report of the state of |search|: the generation count, best score, and each population entry's id,
// score and rendered grammar, lowest score first.
std::string DumpPopulationJSON(const Search& search);

} // namespace branta

#endif // SRC_BRANTA_DUMP_POPULATION_JSON_HPP_
