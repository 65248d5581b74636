/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "Planwright/core/logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <unistd.h>

namespace Planwright::core {

bool parseLogLevel(std::string_view name, LogLevel& out) {
  if (name == "trace") {
    out = LogLevel::Trace;
  } else if (name == "debug") {
    out = LogLevel::Debug;
  } else if (name == "info") {
    out = LogLevel::Info;
  } else if (name == "warning" || name == "warn") {
    out = LogLevel::Warning;
  } else if (name == "error") {
    out = LogLevel::Error;
  } else if (name == "fatal") {
    out = LogLevel::Fatal;
  } else if (name == "off") {
    out = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : m_level(LogLevel::Info), m_useColors(::isatty(STDERR_FILENO) != 0) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.flush();
    m_fileStream.close();
  }
}

void Logger::setUseColors(bool useColors) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_useColors = useColors;
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  if (level == LogLevel::Off) {
    return;
  }

  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level) {
      return;
    }

    std::string line =
        "[" + getCurrentTimestamp() + "] [" + levelToString(level) + "] " + std::string(message);

    if (m_useColors) {
      std::cerr << levelToColor(level) << line << "\033[0m\n";
    } else {
      std::cerr << line << '\n';
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << '\n';
      if (level >= LogLevel::Error) {
        m_fileStream.flush();
      }
    }

    // Callbacks run outside the lock so they may log themselves
    callbacks = m_callbacks;
  }

  const std::string text(message);
  for (const auto& callback : callbacks) {
    if (callback) {
      callback(level, text);
    }
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  case LogLevel::Off:
    return "OFF";
  }
  return "UNKNOWN";
}

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "\033[90m";
  case LogLevel::Debug:
    return "\033[36m";
  case LogLevel::Info:
    return "\033[32m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
  case LogLevel::Fatal:
    return "\033[31m";
  case LogLevel::Off:
    break;
  }
  return "";
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;

  std::tm tmBuf{};
  localtime_r(&time, &tmBuf);

  std::ostringstream oss;
  oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
      << ms;
  return oss.str();
}

} // namespace Planwright::core
