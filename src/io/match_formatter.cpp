#include "match_formatter.hpp"

#include <sstream>
#include <utility>

nlohmann::json
MatchFormatter::hits_to_json_object(const std::string &source,
                                    const std::vector<Matcher::MatchHit> &hits,
                                    bool with_positions) {
  nlohmann::json j;
  j["source"] = source;
  j["match_count"] = hits.size();

  nlohmann::json matches = nlohmann::json::array();
  for (const auto &hit : hits) {
    if (with_positions) {
      nlohmann::json m;
      m["pattern"] = std::string(hit.pattern);
      m["start"] = hit.start;
      m["end"] = hit.end;
      matches.push_back(std::move(m));
    } else {
      matches.push_back(std::string(hit.pattern));
    }
  }
  j["matches"] = std::move(matches);
  return j;
}

std::string
MatchFormatter::format_hits_as_json(const std::string &source,
                                    const std::vector<Matcher::MatchHit> &hits,
                                    bool with_positions) {
  return hits_to_json_object(source, hits, with_positions)
      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string
MatchFormatter::format_hits_as_text(const std::string &source,
                                    const std::vector<Matcher::MatchHit> &hits,
                                    bool with_positions) {
  std::ostringstream o;
  for (const auto &hit : hits) {
    if (with_positions)
      o << source << ':' << hit.start << '-' << hit.end << '\t';
    o << hit.pattern << '\n';
  }
  return o.str();
}
