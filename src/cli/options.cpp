#include "options.hpp"
#include "matcher/pattern_spec.hpp"

#include <iostream>
#include <string_view>

namespace Cli {

void print_usage(const char *argv0) {
  std::cerr << "usage: " << argv0
            << " [-c config.ini] [-p \"cat|dog\"] [-f patterns.txt]\n"
            << "       [--json] [--positions] [--dense] [--dedup] [--first]\n"
            << "       [-t \"text to scan\" | input_file ...]\n"
            << "Reads stdin when neither -t nor input files are given.\n";
}

std::optional<CliOptions> parse_arguments(int argc, const char *const argv[]) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    auto next_value = [&]() -> const char * {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << arg << std::endl;
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "-h" || arg == "--help") {
      return std::nullopt;
    } else if (arg == "-c" || arg == "-p" || arg == "-f" || arg == "-t") {
      const char *value = next_value();
      if (!value)
        return std::nullopt;
      if (arg == "-c")
        opts.config_path = value;
      else if (arg == "-p")
        opts.patterns = value;
      else if (arg == "-f")
        opts.patterns_file = value;
      else
        opts.text = value;
    } else if (arg == "--json") {
      opts.json = true;
    } else if (arg == "--positions") {
      opts.positions = true;
    } else if (arg == "--dense") {
      opts.dense = true;
    } else if (arg == "--dedup") {
      opts.dedup = true;
    } else if (arg == "--first") {
      opts.first_only = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      return std::nullopt;
    } else {
      opts.input_files.emplace_back(arg);
    }
  }
  return opts;
}

Config::AppConfig merge_options(const Config::AppConfig &base,
                                const CliOptions &opts) {
  Config::AppConfig cfg = base;
  if (opts.patterns || opts.patterns_file) {
    cfg.patterns.clear();
    cfg.patterns_file.clear();
    if (opts.patterns)
      cfg.patterns = *opts.patterns;
    if (opts.patterns_file)
      cfg.patterns_file = *opts.patterns_file;
  }
  if (opts.json)
    cfg.output_format = "json";
  if (opts.positions)
    cfg.report_positions = true;
  if (opts.dense)
    cfg.matcher.transition_mode = Matcher::TransitionMode::DENSE;
  if (opts.dedup)
    cfg.matcher.duplicate_policy = Matcher::DuplicatePolicy::DEDUPLICATE;
  if (opts.first_only)
    cfg.stop_after_first_match = true;
  return cfg;
}

std::optional<std::vector<std::string>>
collect_patterns(const Config::AppConfig &cfg) {
  std::vector<std::string> patterns = Matcher::split_pattern_spec(cfg.patterns);
  if (!cfg.patterns_file.empty()) {
    auto from_file = Matcher::load_patterns_file(cfg.patterns_file);
    if (!from_file)
      return std::nullopt;
    patterns.insert(patterns.end(), from_file->begin(), from_file->end());
  }
  return patterns;
}

std::vector<std::string> input_sources(const CliOptions &opts,
                                       const Config::AppConfig &cfg) {
  if (!opts.input_files.empty())
    return opts.input_files;
  if (!cfg.input_path.empty())
    return {cfg.input_path};
  return {};
}

int exit_code_for(size_t total_matches, bool had_input_error) {
  if (had_input_error)
    return EXIT_FAILURE_USAGE;
  return total_matches > 0 ? EXIT_MATCHED : EXIT_NO_MATCH;
}

} // namespace Cli
