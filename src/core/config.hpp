#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "matcher/aho_corasick.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *PATTERNS = "patterns";
constexpr const char *PATTERNS_FILE = "patterns_file";
constexpr const char *INPUT_PATH = "input_path";
constexpr const char *OUTPUT_FORMAT = "output_format";
constexpr const char *REPORT_POSITIONS = "report_positions";
constexpr const char *STOP_AFTER_FIRST_MATCH = "stop_after_first_match";

// Matcher Settings
constexpr const char *MA_DUPLICATE_POLICY = "duplicate_policy";
constexpr const char *MA_TRANSITION_MODE = "transition_mode";
constexpr const char *MA_READ_CHUNK_SIZE = "read_chunk_size";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

constexpr size_t MIN_READ_CHUNK_SIZE = 1;
constexpr size_t MAX_READ_CHUNK_SIZE = 64 * 1024 * 1024;

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct MatcherConfig {
  Matcher::DuplicatePolicy duplicate_policy =
      Matcher::DuplicatePolicy::PRESERVE;
  Matcher::TransitionMode transition_mode = Matcher::TransitionMode::SPARSE;
  size_t read_chunk_size = 64 * 1024;
};

struct AppConfig {
  std::string patterns;
  std::string patterns_file;
  std::string input_path;
  std::string output_format = "text";
  bool report_positions = false;
  bool stop_after_first_match = false;

  MatcherConfig matcher;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  // Raw values that failed to parse, kept so validation can report them
  std::vector<std::string> invalid_values;

  AppConfig();
};

LogLevel string_to_log_level(const std::string &level_str_raw);
bool string_to_bool(const std::string &val_str_raw);

// Fills `config` from an INI file. Returns false if the file cannot be read.
bool parse_config_into(const std::string &filepath, AppConfig &config);

bool validate_matcher_config(const MatcherConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
