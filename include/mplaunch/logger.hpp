#ifndef MPLAUNCH_LOGGER_HPP
#define MPLAUNCH_LOGGER_HPP

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace mplaunch {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

class Logger {
public:
  static Logger &instance();

  // Opens (appends to) the session log. Safe to skip: without a file, lines
  // still reach the console according to the verbosity rules.
  void init(const std::filesystem::path &logPath, bool verbose);
  void log(LogLevel level, const std::string &message);

  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

private:
  Logger() = default;
  ~Logger();

  std::ofstream logFile_;
  bool verbose_ = false;
  std::mutex mutex_;

  static std::string getTimestamp();
  static std::string getLevelString(LogLevel level);
};

#define LOG_DEBUG(msg)                                                         \
  mplaunch::Logger::instance().log(mplaunch::LogLevel::DEBUG, msg)
#define LOG_INFO(msg)                                                          \
  mplaunch::Logger::instance().log(mplaunch::LogLevel::INFO, msg)
#define LOG_WARN(msg)                                                          \
  mplaunch::Logger::instance().log(mplaunch::LogLevel::WARNING, msg)
#define LOG_ERROR(msg)                                                         \
  mplaunch::Logger::instance().log(mplaunch::LogLevel::ERROR, msg)

} // namespace mplaunch

#endif // MPLAUNCH_LOGGER_HPP
