#ifndef MATCH_FORMATTER_HPP
#define MATCH_FORMATTER_HPP

#include "matcher/aho_corasick.hpp"
#include "nlohmann/json.hpp"

#include <string>
#include <vector>

namespace MatchFormatter {

// {"source": ..., "match_count": N, "matches": [...]}. Matches are plain
// pattern strings, or {"pattern", "start", "end"} objects with positions.
nlohmann::json hits_to_json_object(const std::string &source,
                                   const std::vector<Matcher::MatchHit> &hits,
                                   bool with_positions);

std::string format_hits_as_json(const std::string &source,
                                const std::vector<Matcher::MatchHit> &hits,
                                bool with_positions);

// One line per hit: "<pattern>", or "<source>:<start>-<end>\t<pattern>".
std::string format_hits_as_text(const std::string &source,
                                const std::vector<Matcher::MatchHit> &hits,
                                bool with_positions);

} // namespace MatchFormatter

#endif // MATCH_FORMATTER_HPP
