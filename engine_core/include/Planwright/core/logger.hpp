#pragma once

#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Planwright::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 * "fatal", "off")
 * @return true when the name is known; @p out is left untouched otherwise
 */
bool parseLogLevel(std::string_view name, LogLevel& out);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  void setUseColors(bool useColors);

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

private:
  Logger();
  ~Logger();

  [[nodiscard]] const char* levelToString(LogLevel level) const;
  [[nodiscard]] const char* levelToColor(LogLevel level) const;
  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  std::vector<LogCallback> m_callbacks;
};

} // namespace Planwright::core

#define PLANWRIGHT_LOG_TRACE(...) ::Planwright::core::Logger::instance().trace(__VA_ARGS__)
#define PLANWRIGHT_LOG_DEBUG(...) ::Planwright::core::Logger::instance().debug(__VA_ARGS__)
#define PLANWRIGHT_LOG_INFO(...) ::Planwright::core::Logger::instance().info(__VA_ARGS__)
#define PLANWRIGHT_LOG_WARN(...) ::Planwright::core::Logger::instance().warning(__VA_ARGS__)
#define PLANWRIGHT_LOG_ERROR(...) ::Planwright::core::Logger::instance().error(__VA_ARGS__)
#define PLANWRIGHT_LOG_FATAL(...) ::Planwright::core::Logger::instance().fatal(__VA_ARGS__)
