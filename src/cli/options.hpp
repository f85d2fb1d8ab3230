#ifndef CLI_OPTIONS_HPP
#define CLI_OPTIONS_HPP

#include "core/config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Cli {

constexpr int EXIT_MATCHED = 0;
constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_FAILURE_USAGE = 2;

struct CliOptions {
  std::string config_path;
  std::optional<std::string> patterns;
  std::optional<std::string> patterns_file;
  std::optional<std::string> text;
  std::vector<std::string> input_files;
  bool json = false;
  bool positions = false;
  bool dense = false;
  bool dedup = false;
  bool first_only = false;
};

void print_usage(const char *argv0);

// Returns nullopt on --help, an unknown option or a flag missing its value.
std::optional<CliOptions> parse_arguments(int argc, const char *const argv[]);

// Command line flags win over the configuration file. Either -p or -f
// replaces both configured pattern sources.
Config::AppConfig merge_options(const Config::AppConfig &base,
                                const CliOptions &opts);

// Inline patterns first, then the patterns file. nullopt if the file cannot
// be read.
std::optional<std::vector<std::string>>
collect_patterns(const Config::AppConfig &cfg);

// Files to scan when no -t text was given. Empty means stdin.
std::vector<std::string> input_sources(const CliOptions &opts,
                                       const Config::AppConfig &cfg);

int exit_code_for(size_t total_matches, bool had_input_error);

} // namespace Cli

#endif // CLI_OPTIONS_HPP
