#include "stream_scanner.hpp"

namespace Matcher {

StreamScanner::StreamScanner(const AhoCorasick &automaton)
    : automaton_(automaton) {
  automaton_.require_built("StreamScanner");
}

void StreamScanner::reset() {
  state_ = AhoCorasick::ROOT;
  offset_ = 0;
}

} // namespace Matcher
