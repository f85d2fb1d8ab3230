#ifndef AHO_CORASICK_HPP
#define AHO_CORASICK_HPP

#include "matcher_errors.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Matcher {

enum class DuplicatePolicy { PRESERVE, DEDUPLICATE };

// SPARSE walks fallback links while scanning, DENSE precomputes a full
// 256-wide goto table per state at build() time.
enum class TransitionMode { SPARSE, DENSE };

// One reported occurrence. `end` is exclusive, so the matched bytes are
// text[start, end). `pattern` points into the automaton's pattern table.
struct MatchHit {
  size_t pattern_id = 0;
  std::string_view pattern;
  size_t start = 0;
  size_t end = 0;
};

class StreamScanner;

class AhoCorasick {
public:
  static constexpr int ROOT = 0;

  explicit AhoCorasick(DuplicatePolicy policy = DuplicatePolicy::PRESERVE,
                       TransitionMode mode = TransitionMode::SPARSE);

  // Inserts every pattern and builds. Throws InvalidPatternError on an empty
  // entry.
  explicit AhoCorasick(const std::vector<std::string> &patterns,
                       DuplicatePolicy policy = DuplicatePolicy::PRESERVE,
                       TransitionMode mode = TransitionMode::SPARSE);

  // Returns the id of the inserted pattern. Under DEDUPLICATE a repeated
  // literal returns the id of its first insertion.
  size_t add_pattern(std::string_view pattern);

  // Computes fallback links and merged output sets, then freezes.
  void build();

  std::vector<std::string> match(std::string_view text) const;
  std::vector<MatchHit> match_positions(std::string_view text) const;
  bool contains_any(std::string_view text) const;
  size_t count_matches(std::string_view text) const;

  // Calls visitor(const MatchHit &) for every occurrence in scan order. The
  // visitor returns false to stop early; the result is false in that case.
  template <typename Visitor>
  bool for_each_match(std::string_view text, Visitor &&visitor) const {
    require_built("for_each_match");
    int state = ROOT;
    for (size_t i = 0; i < text.size(); ++i) {
      state = next_state(state, static_cast<unsigned char>(text[i]));
      if (!report(state, i + 1, visitor))
        return false;
    }
    return true;
  }

  bool is_built() const { return built_; }
  size_t pattern_count() const { return patterns_.size(); }
  size_t node_count() const { return trie_.size(); }
  const std::vector<std::string> &patterns() const { return patterns_; }
  DuplicatePolicy duplicate_policy() const { return duplicate_policy_; }
  TransitionMode transition_mode() const { return transition_mode_; }

  // Introspection for tests and diagnostics. Ids are arena indices.
  int fallback_of(int node) const;
  int depth_of(int node) const;
  const std::vector<size_t> &matched_patterns_of(int node) const;
  int find_node(std::string_view prefix) const;

private:
  friend class StreamScanner;

  struct TrieNode {
    std::unordered_map<unsigned char, int> children;
    int fallback = ROOT;
    int depth = 0;
    bool is_terminal = false;
    std::vector<size_t> matched_patterns;
  };

  void require_built(const char *operation) const;
  int next_state(int state, unsigned char symbol) const;
  void fill_goto_table(const std::vector<int> &bfs_order);

  template <typename Visitor>
  bool report(int state, size_t end, Visitor &visitor) const {
    for (size_t id : trie_[state].matched_patterns) {
      const std::string &pattern = patterns_[id];
      MatchHit hit{id, pattern, end - pattern.size(), end};
      if (!visitor(hit))
        return false;
    }
    return true;
  }

  std::vector<TrieNode> trie_;
  std::vector<std::string> patterns_;
  std::vector<std::array<int, 256>> goto_table_;
  DuplicatePolicy duplicate_policy_;
  TransitionMode transition_mode_;
  bool built_ = false;
};

const char *duplicate_policy_to_string(DuplicatePolicy policy);
const char *transition_mode_to_string(TransitionMode mode);

} // namespace Matcher

#endif // AHO_CORASICK_HPP
