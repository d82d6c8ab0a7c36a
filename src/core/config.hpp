#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Window Settings
constexpr const char *WINDOW_DEFAULT_DURATION_MS = "default_duration_ms";

} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct WindowConfig {
  // Used by callers that construct collections without an explicit window.
  uint64_t default_duration_ms = 60000;
};

struct AppConfig {
  LoggingConfig logging;
  WindowConfig window;

  AppConfig() = default;
};

LogLevel string_to_log_level(const std::string &level_str_raw);

bool parse_config_into(const std::string &filepath, AppConfig &config);

// Validation functions for configuration parameters
bool validate_window_config(const WindowConfig &config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Default window length as a steady clock duration.
std::chrono::milliseconds default_window(const AppConfig &config);

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
