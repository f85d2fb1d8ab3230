#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace Config {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"matcher.build", LogComponent::MATCHER_BUILD},
    {"matcher.scan", LogComponent::MATCHER_SCAN},
    {"io.input", LogComponent::IO_INPUT},
    {"io.output", LogComponent::IO_OUTPUT}};

AppConfig::AppConfig() {
  // Everything at WARN, except CORE which reports INFO by default
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

namespace {

bool parse_duplicate_policy(const std::string &value,
                            Matcher::DuplicatePolicy &out) {
  std::string v = Utils::to_lower_copy(value);
  if (v == "preserve")
    out = Matcher::DuplicatePolicy::PRESERVE;
  else if (v == "deduplicate" || v == "dedup")
    out = Matcher::DuplicatePolicy::DEDUPLICATE;
  else
    return false;
  return true;
}

bool parse_transition_mode(const std::string &value,
                           Matcher::TransitionMode &out) {
  std::string v = Utils::to_lower_copy(value);
  if (v == "sparse")
    out = Matcher::TransitionMode::SPARSE;
  else if (v == "dense")
    out = Matcher::TransitionMode::DENSE;
  else
    return false;
  return true;
}

} // namespace

bool validate_matcher_config(const MatcherConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (config.read_chunk_size < MIN_READ_CHUNK_SIZE ||
      config.read_chunk_size > MAX_READ_CHUNK_SIZE) {
    errors.push_back("Matcher read_chunk_size must be between 1 and " +
                     std::to_string(MAX_READ_CHUNK_SIZE) + " bytes");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.output_format != "text" && config.output_format != "json") {
    errors.push_back("output_format must be one of: text, json");
    valid = false;
  }

  if (!validate_matcher_config(config.matcher, errors)) {
    valid = false;
  }

  for (const auto &bad : config.invalid_values) {
    errors.push_back(bad);
    valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Attempting to load configuration from " << filepath);
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    // Global (non-section) keys
    if (current_section.empty()) {
      if (key == Keys::PATTERNS)
        config.patterns = value;
      else if (key == Keys::PATTERNS_FILE)
        config.patterns_file = value;
      else if (key == Keys::INPUT_PATH)
        config.input_path = value;
      else if (key == Keys::OUTPUT_FORMAT)
        config.output_format = Utils::to_lower_copy(value);
      else if (key == Keys::REPORT_POSITIONS)
        config.report_positions = string_to_bool(value);
      else if (key == Keys::STOP_AFTER_FIRST_MATCH)
        config.stop_after_first_match = string_to_bool(value);
      else
        config.custom_settings[key] = value;

      // Matcher Settings
    } else if (current_section == "Matcher") {
      if (key == Keys::MA_DUPLICATE_POLICY) {
        if (!parse_duplicate_policy(value, config.matcher.duplicate_policy))
          config.invalid_values.push_back(
              "Matcher duplicate_policy must be one of: preserve, "
              "deduplicate (got '" +
              value + "')");
      } else if (key == Keys::MA_TRANSITION_MODE) {
        if (!parse_transition_mode(value, config.matcher.transition_mode))
          config.invalid_values.push_back(
              "Matcher transition_mode must be one of: sparse, dense (got '" +
              value + "')");
      } else if (key == Keys::MA_READ_CHUNK_SIZE) {
        auto size = Utils::string_to_number<size_t>(value);
        if (size)
          config.matcher.read_chunk_size = *size;
        else
          config.invalid_values.push_back(
              "Matcher read_chunk_size is not a number (got '" + value + "')");
      }

      // Logging Settings
    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "matcher.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        }
      }
    }
  }

  config_file.close();
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::DEBUG, LogComponent::CONFIG,
      "Configuration loaded and validated from " << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
