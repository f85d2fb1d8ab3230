#include "cli/options.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "io/input_scanner.hpp"
#include "io/match_formatter.hpp"
#include "matcher/aho_corasick.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void emit(const Config::AppConfig &cfg, const std::string &source,
          const std::vector<Matcher::MatchHit> &hits) {
  if (cfg.output_format == "json")
    std::cout << MatchFormatter::format_hits_as_json(source, hits,
                                                     cfg.report_positions)
              << '\n';
  else
    std::cout << MatchFormatter::format_hits_as_text(source, hits,
                                                     cfg.report_positions);
  LOG(LogLevel::INFO, LogComponent::CORE,
      source << ": " << hits.size() << " matches");
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  auto opts = Cli::parse_arguments(argc, argv);
  if (!opts) {
    Cli::print_usage(argv[0]);
    return Cli::EXIT_FAILURE_USAGE;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!opts->config_path.empty() &&
      !config_manager.load_configuration(opts->config_path))
    return Cli::EXIT_FAILURE_USAGE;

  const Config::AppConfig cfg =
      Cli::merge_options(*config_manager.get_config(), *opts);

  // --- Initialize Logging ---
  LogManager::instance().configure(cfg.logging);

  std::vector<std::string> validation_errors;
  if (!Config::validate_app_config(cfg, validation_errors)) {
    for (const auto &error : validation_errors)
      LOG(LogLevel::ERROR, LogComponent::CONFIG, error);
    return Cli::EXIT_FAILURE_USAGE;
  }

  auto patterns = Cli::collect_patterns(cfg);
  if (!patterns)
    return Cli::EXIT_FAILURE_USAGE;
  if (patterns->empty()) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "No patterns given (use -p, -f or the 'patterns' config key)");
    Cli::print_usage(argv[0]);
    return Cli::EXIT_FAILURE_USAGE;
  }

  std::unique_ptr<Matcher::AhoCorasick> automaton;
  try {
    automaton = std::make_unique<Matcher::AhoCorasick>(
        *patterns, cfg.matcher.duplicate_policy, cfg.matcher.transition_mode);
  } catch (const Matcher::MatcherError &e) {
    LOG(LogLevel::ERROR, LogComponent::CORE,
        "Failed to build automaton: " << e.what());
    return Cli::EXIT_FAILURE_USAGE;
  }

  LOG(LogLevel::INFO, LogComponent::CORE,
      "Automaton ready: " << automaton->pattern_count() << " patterns, "
                          << automaton->node_count() << " nodes");

  size_t total_matches = 0;
  bool had_input_error = false;

  std::vector<Matcher::MatchHit> hits;
  auto collect = [&](const Matcher::MatchHit &hit) {
    hits.push_back(hit);
    return !cfg.stop_after_first_match;
  };

  if (opts->text) {
    automaton->for_each_match(*opts->text, collect);
    emit(cfg, "<text>", hits);
    total_matches += hits.size();
  } else {
    const std::vector<std::string> sources = Cli::input_sources(*opts, cfg);

    if (sources.empty()) {
      auto summary = IO::scan_stream(std::cin, *automaton,
                                     cfg.matcher.read_chunk_size, collect);
      if (summary)
        emit(cfg, "<stdin>", hits);
      else
        had_input_error = true;
      total_matches += hits.size();
    }

    for (const auto &source : sources) {
      hits.clear();
      auto summary = IO::scan_file(source, *automaton,
                                   cfg.matcher.read_chunk_size, collect);
      if (!summary) {
        had_input_error = true;
        continue;
      }
      emit(cfg, source, hits);
      total_matches += hits.size();
      if (cfg.stop_after_first_match && total_matches > 0)
        break;
    }
  }

  std::cout.flush();
  return Cli::exit_code_for(total_matches, had_input_error);
}
