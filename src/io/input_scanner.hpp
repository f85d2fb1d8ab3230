#ifndef INPUT_SCANNER_HPP
#define INPUT_SCANNER_HPP

#include "matcher/aho_corasick.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace IO {

using HitCallback = std::function<bool(const Matcher::MatchHit &)>;

struct ScanSummary {
  size_t bytes_scanned = 0;
  size_t match_count = 0;
  bool stopped_early = false;
};

// Reads `input` in chunks of `chunk_size` bytes and feeds them through a
// StreamScanner. Returns std::nullopt for a zero chunk size or if the stream
// fails with a read error.
std::optional<ScanSummary> scan_stream(std::istream &input,
                                       const Matcher::AhoCorasick &automaton,
                                       size_t chunk_size,
                                       const HitCallback &on_hit);

std::optional<ScanSummary> scan_file(const std::string &filepath,
                                     const Matcher::AhoCorasick &automaton,
                                     size_t chunk_size,
                                     const HitCallback &on_hit);

} // namespace IO

#endif // INPUT_SCANNER_HPP
