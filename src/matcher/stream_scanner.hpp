#ifndef STREAM_SCANNER_HPP
#define STREAM_SCANNER_HPP

#include "aho_corasick.hpp"

#include <cstddef>
#include <string_view>

namespace Matcher {

// Scans input delivered in chunks. The automaton state survives between
// feed() calls, so a pattern split across chunk boundaries is still found and
// reported with offsets relative to the start of the whole stream.
// One scanner per thread; any number of scanners may share an automaton.
class StreamScanner {
public:
  explicit StreamScanner(const AhoCorasick &automaton);

  template <typename Visitor>
  bool feed(std::string_view chunk, Visitor &&visitor) {
    for (char ch : chunk) {
      state_ = automaton_.next_state(state_, static_cast<unsigned char>(ch));
      ++offset_;
      if (!automaton_.report(state_, offset_, visitor))
        return false;
    }
    return true;
  }

  void reset();
  size_t offset() const { return offset_; }

private:
  const AhoCorasick &automaton_;
  int state_ = AhoCorasick::ROOT;
  size_t offset_ = 0;
};

} // namespace Matcher

#endif // STREAM_SCANNER_HPP
