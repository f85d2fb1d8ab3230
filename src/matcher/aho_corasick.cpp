#include "aho_corasick.hpp"
#include "core/logger.hpp"

#include <cstddef>
#include <queue>
#include <string>
#include <string_view>
#include <vector>

namespace Matcher {

AhoCorasick::AhoCorasick(DuplicatePolicy policy, TransitionMode mode)
    : duplicate_policy_(policy), transition_mode_(mode) {
  trie_.emplace_back(); // Root node
}

AhoCorasick::AhoCorasick(const std::vector<std::string> &patterns,
                         DuplicatePolicy policy, TransitionMode mode)
    : AhoCorasick(policy, mode) {
  for (const auto &pattern : patterns)
    add_pattern(pattern);
  build();
}

size_t AhoCorasick::add_pattern(std::string_view pattern) {
  if (built_)
    throw AlreadyBuiltError("Cannot add pattern '" + std::string(pattern) +
                            "': automaton is already built");
  if (pattern.empty())
    throw InvalidPatternError("Pattern must not be empty");

  int node = ROOT;
  for (char ch : pattern) {
    auto symbol = static_cast<unsigned char>(ch);
    auto it = trie_[node].children.find(symbol);
    if (it == trie_[node].children.end()) {
      int child = static_cast<int>(trie_.size());
      int depth = trie_[node].depth + 1;
      // emplace_back may reallocate, so re-index after it
      trie_.emplace_back();
      trie_[child].depth = depth;
      trie_[node].children.emplace(symbol, child);
      node = child;
    } else {
      node = it->second;
    }
  }

  TrieNode &terminal = trie_[node];
  if (terminal.is_terminal &&
      duplicate_policy_ == DuplicatePolicy::DEDUPLICATE) {
    LOG(LogLevel::DEBUG, LogComponent::MATCHER_BUILD,
        "Ignoring duplicate pattern '" << pattern << "'");
    return terminal.matched_patterns.front();
  }

  size_t id = patterns_.size();
  patterns_.emplace_back(pattern);
  terminal.is_terminal = true;
  terminal.matched_patterns.push_back(id);
  return id;
}

void AhoCorasick::build() {
  if (built_)
    throw AlreadyBuiltError("build() called twice on the same automaton");

  LOG(LogLevel::DEBUG, LogComponent::MATCHER_BUILD,
      "Building failure links for " << patterns_.size() << " patterns over "
                                    << trie_.size() << " nodes");

  std::vector<int> bfs_order;
  bfs_order.reserve(trie_.size());
  bfs_order.push_back(ROOT);

  std::queue<int> q;
  for (auto const &[symbol, child] : trie_[ROOT].children) {
    trie_[child].fallback = ROOT;
    q.push(child);
  }

  while (!q.empty()) {
    int u = q.front();
    q.pop();
    bfs_order.push_back(u);

    for (auto const &[symbol, v] : trie_[u].children) {
      q.push(v);

      int candidate = trie_[u].fallback;
      while (candidate != ROOT && !trie_[candidate].children.count(symbol))
        candidate = trie_[candidate].fallback;

      auto it = trie_[candidate].children.find(symbol);
      int fallback = it != trie_[candidate].children.end() ? it->second : ROOT;
      trie_[v].fallback = fallback;

      const auto &inherited = trie_[fallback].matched_patterns;
      auto &own = trie_[v].matched_patterns;
      own.insert(own.end(), inherited.begin(), inherited.end());

      LOG(LogLevel::TRACE, LogComponent::MATCHER_BUILD,
          "node " << v << " (depth " << trie_[v].depth << ") -> fallback "
                  << fallback << ", " << own.size() << " outputs");
    }
  }

  if (transition_mode_ == TransitionMode::DENSE)
    fill_goto_table(bfs_order);

  built_ = true;
  LOG(LogLevel::DEBUG, LogComponent::MATCHER_BUILD,
      "Automaton frozen (" << transition_mode_to_string(transition_mode_)
                           << " transitions)");
}

// Every state's row is its own children overlaid on its fallback's row.
// Processing in BFS order guarantees the fallback row is already complete.
void AhoCorasick::fill_goto_table(const std::vector<int> &bfs_order) {
  goto_table_.assign(trie_.size(), {});
  for (int node : bfs_order) {
    auto &row = goto_table_[node];
    if (node == ROOT)
      row.fill(ROOT);
    else
      row = goto_table_[trie_[node].fallback];
    for (auto const &[symbol, child] : trie_[node].children)
      row[symbol] = child;
  }
}

int AhoCorasick::next_state(int state, unsigned char symbol) const {
  if (!goto_table_.empty())
    return goto_table_[state][symbol];

  while (state != ROOT && !trie_[state].children.count(symbol))
    state = trie_[state].fallback;

  auto it = trie_[state].children.find(symbol);
  return it != trie_[state].children.end() ? it->second : ROOT;
}

void AhoCorasick::require_built(const char *operation) const {
  if (!built_)
    throw NotBuiltError(std::string(operation) +
                        "() called before build()");
}

std::vector<std::string> AhoCorasick::match(std::string_view text) const {
  std::vector<std::string> found_patterns;
  for_each_match(text, [&](const MatchHit &hit) {
    found_patterns.emplace_back(hit.pattern);
    return true;
  });
  return found_patterns;
}

std::vector<MatchHit>
AhoCorasick::match_positions(std::string_view text) const {
  std::vector<MatchHit> hits;
  for_each_match(text, [&](const MatchHit &hit) {
    hits.push_back(hit);
    return true;
  });
  return hits;
}

bool AhoCorasick::contains_any(std::string_view text) const {
  return !for_each_match(text, [](const MatchHit &) { return false; });
}

size_t AhoCorasick::count_matches(std::string_view text) const {
  size_t count = 0;
  for_each_match(text, [&](const MatchHit &) {
    ++count;
    return true;
  });
  return count;
}

int AhoCorasick::fallback_of(int node) const { return trie_.at(node).fallback; }

int AhoCorasick::depth_of(int node) const { return trie_.at(node).depth; }

const std::vector<size_t> &AhoCorasick::matched_patterns_of(int node) const {
  return trie_.at(node).matched_patterns;
}

int AhoCorasick::find_node(std::string_view prefix) const {
  int node = ROOT;
  for (char ch : prefix) {
    auto it = trie_[node].children.find(static_cast<unsigned char>(ch));
    if (it == trie_[node].children.end())
      return -1;
    node = it->second;
  }
  return node;
}

const char *duplicate_policy_to_string(DuplicatePolicy policy) {
  switch (policy) {
  case DuplicatePolicy::PRESERVE:
    return "preserve";
  case DuplicatePolicy::DEDUPLICATE:
    return "deduplicate";
  }
  return "unknown";
}

const char *transition_mode_to_string(TransitionMode mode) {
  switch (mode) {
  case TransitionMode::SPARSE:
    return "sparse";
  case TransitionMode::DENSE:
    return "dense";
  }
  return "unknown";
}

} // namespace Matcher
