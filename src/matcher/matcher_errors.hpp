#ifndef MATCHER_ERRORS_HPP
#define MATCHER_ERRORS_HPP

#include <exception>
#include <string>

namespace Matcher {

// Base class for every precondition violation raised by the automaton
class MatcherError : public std::exception {
public:
  explicit MatcherError(const std::string &msg) : message_(msg) {}
  const char *what() const noexcept override { return message_.c_str(); }

private:
  std::string message_;
};

// Raised by add_pattern() for a zero-length pattern
class InvalidPatternError : public MatcherError {
public:
  using MatcherError::MatcherError;
};

// Raised when a query runs before build()
class NotBuiltError : public MatcherError {
public:
  using MatcherError::MatcherError;
};

// Raised by add_pattern() or build() once the automaton is frozen
class AlreadyBuiltError : public MatcherError {
public:
  using MatcherError::MatcherError;
};

} // namespace Matcher

#endif // MATCHER_ERRORS_HPP
