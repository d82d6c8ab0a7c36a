#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

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

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"window", LogComponent::WINDOW},
    {"window.sequence", LogComponent::WINDOW_SEQUENCE},
    {"window.set", LogComponent::WINDOW_SET}};

bool validate_window_config(const WindowConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  // The steady clock counts in a signed representation, so the window must
  // fit in it once converted.
  const auto max_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::duration::max())
                          .count();
  if (config.default_duration_ms > static_cast<uint64_t>(max_ms)) {
    errors.push_back("Window default duration must not exceed " +
                     std::to_string(max_ms) + " ms");
    valid = false;
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_window_config(config.window, errors)) {
    valid = false;
  }

  return valid;
}

std::chrono::milliseconds default_window(const AppConfig &config) {
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(
          config.window.default_duration_ms));
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }

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

    if (current_section == "Logging") {
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
          // Wildcard match, e.g., "window.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
        }
      }

    } else if (current_section == "Window") {
      if (key == Keys::WINDOW_DEFAULT_DURATION_MS) {
        if (value.empty()) {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Empty value for key '" << key
                    << "', keeping default" << std::endl;
          continue;
        }
        auto parsed = Utils::string_to_number<uint64_t>(value);
        if (parsed)
          config.window.default_duration_ms = *parsed;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Invalid value for key '" << key << "': '" << value
                    << "'" << std::endl;
      }
    }
  }

  config_file.close();
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
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
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated from " << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
